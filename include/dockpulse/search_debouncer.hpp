#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

namespace dockpulse {

class SearchDebouncer final : public QObject {
    Q_OBJECT

public:
    explicit SearchDebouncer(int delayMs = 100, QObject* parent = nullptr);

    void schedule(const QString& search);
    void cancel();

    [[nodiscard]] bool isPending() const { return timer_->isActive(); }
    [[nodiscard]] int delayMs() const { return timer_->interval(); }
    void setDelayMs(int delayMs);

signals:
    void triggered(const QString& search);

private:
    QTimer* timer_;
    QString pendingSearch_;
};

}  // namespace dockpulse
