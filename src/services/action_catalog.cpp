#include "dockpulse/action_catalog.hpp"

namespace dockpulse {

const QVector<ActionMeta>& ActionCatalog::all() {
    static const QVector<ActionMeta> catalog = {
        {DockerAction::Run, "Run image", ActionRisk::Safe, true, {SelectionKind::Image}},
        {DockerAction::Start, "Start", ActionRisk::Safe, true, {SelectionKind::Container}},
        {DockerAction::Stop, "Stop", ActionRisk::Safe, true, {SelectionKind::Container}},
        {DockerAction::Restart, "Restart", ActionRisk::Safe, true, {SelectionKind::Container}},
        {DockerAction::Logs, "Logs", ActionRisk::Safe, true, {SelectionKind::Container}},
        {DockerAction::Rm, "Remove container", ActionRisk::Danger, true, {SelectionKind::Container}},
        {DockerAction::Rmi, "Remove image", ActionRisk::Danger, true, {SelectionKind::Image}},
    };
    return catalog;
}

const ActionMeta& ActionCatalog::meta(DockerAction action) {
    const QVector<ActionMeta>& catalog = all();
    for (const ActionMeta& entry : catalog) {
        if (entry.action == action) {
            return entry;
        }
    }
    return catalog.first();
}

bool ActionCatalog::isDangerAction(DockerAction action) {
    return meta(action).risk == ActionRisk::Danger;
}

bool ActionCatalog::supportsKind(DockerAction action, SelectionKind kind) {
    return meta(action).supportKinds.contains(kind);
}

ActionState ActionCatalog::resolveActionState(
    DockerAction action,
    const std::optional<SelectionKind>& selectionKind,
    const std::optional<QString>& target,
    const std::optional<QString>& pendingAction) {
    ActionState state;
    state.target = target;

    if (pendingAction.has_value()) {
        state.reason = QString("Another command is running");
        return state;
    }

    const ActionMeta& entry = meta(action);
    if (!selectionKind.has_value() || !entry.supportKinds.contains(*selectionKind)) {
        state.reason = QString("Selection does not support this action");
        return state;
    }

    if (entry.requireTarget && (!target.has_value() || target->isEmpty())) {
        state.reason = QString("Invalid target");
        return state;
    }

    state.disabled = false;
    return state;
}

}  // namespace dockpulse
