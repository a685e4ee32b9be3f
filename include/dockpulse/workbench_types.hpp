#pragma once

#include <QString>

#include <optional>

namespace dockpulse {

enum class DockerView {
    Containers,
    Images,
    Stats,
    Compose,
};

enum class SelectionKind {
    Container,
    Image,
    Stat,
    Compose,
};

enum class DockerAction {
    Run,
    Start,
    Stop,
    Restart,
    Logs,
    Rm,
    Rmi,
};

struct SelectionEntry {
    SelectionKind kind = SelectionKind::Container;
    QString key;
    QString title;
    QString subtitle;
    std::optional<QString> target;
};

struct WorkbenchSelection {
    SelectionKind kind = SelectionKind::Container;
    QString key;

    bool operator==(const WorkbenchSelection& other) const {
        return kind == other.kind && key == other.key;
    }
    bool operator!=(const WorkbenchSelection& other) const { return !(*this == other); }
};

SelectionKind selectionKindForView(DockerView view);
QString selectionKindName(SelectionKind kind);
std::optional<DockerView> viewFromString(const QString& value);
QString actionName(DockerAction action);
std::optional<DockerAction> actionFromString(const QString& value);

}  // namespace dockpulse
