#include "dockpulse/workbench_types.hpp"

namespace dockpulse {

namespace {

struct ActionName {
    DockerAction action;
    const char* name;
};

constexpr ActionName kActionNames[] = {
    {DockerAction::Run, "run"},
    {DockerAction::Start, "start"},
    {DockerAction::Stop, "stop"},
    {DockerAction::Restart, "restart"},
    {DockerAction::Logs, "logs"},
    {DockerAction::Rm, "rm"},
    {DockerAction::Rmi, "rmi"},
};

}  // namespace

SelectionKind selectionKindForView(DockerView view) {
    switch (view) {
    case DockerView::Images:
        return SelectionKind::Image;
    case DockerView::Stats:
        return SelectionKind::Stat;
    case DockerView::Compose:
        return SelectionKind::Compose;
    case DockerView::Containers:
        break;
    }
    return SelectionKind::Container;
}

QString selectionKindName(SelectionKind kind) {
    switch (kind) {
    case SelectionKind::Image:
        return "image";
    case SelectionKind::Stat:
        return "stat";
    case SelectionKind::Compose:
        return "compose";
    case SelectionKind::Container:
        break;
    }
    return "container";
}

std::optional<DockerView> viewFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "containers") {
        return DockerView::Containers;
    }
    if (normalized == "images") {
        return DockerView::Images;
    }
    if (normalized == "stats") {
        return DockerView::Stats;
    }
    if (normalized == "compose") {
        return DockerView::Compose;
    }
    return std::nullopt;
}

QString actionName(DockerAction action) {
    for (const ActionName& entry : kActionNames) {
        if (entry.action == action) {
            return QString::fromLatin1(entry.name);
        }
    }
    return {};
}

std::optional<DockerAction> actionFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    for (const ActionName& entry : kActionNames) {
        if (normalized == QLatin1String(entry.name)) {
            return entry.action;
        }
    }
    return std::nullopt;
}

}  // namespace dockpulse
