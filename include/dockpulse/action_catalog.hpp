#pragma once

#include <QString>
#include <QVector>

#include <optional>

#include "dockpulse/workbench_types.hpp"

namespace dockpulse {

enum class ActionRisk {
    Safe,
    Danger,
};

struct ActionMeta {
    DockerAction action = DockerAction::Run;
    QString label;
    ActionRisk risk = ActionRisk::Safe;
    bool requireTarget = true;
    QVector<SelectionKind> supportKinds;
};

struct ActionState {
    bool disabled = true;
    std::optional<QString> reason;
    std::optional<QString> target;
};

class ActionCatalog {
public:
    static const QVector<ActionMeta>& all();
    static const ActionMeta& meta(DockerAction action);
    static bool isDangerAction(DockerAction action);
    static bool supportsKind(DockerAction action, SelectionKind kind);

    static ActionState resolveActionState(
        DockerAction action,
        const std::optional<SelectionKind>& selectionKind,
        const std::optional<QString>& target,
        const std::optional<QString>& pendingAction);
};

}  // namespace dockpulse
