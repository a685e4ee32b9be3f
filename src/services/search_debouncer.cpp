#include "dockpulse/search_debouncer.hpp"

#include "dockpulse/telemetry.hpp"

namespace dockpulse {

SearchDebouncer::SearchDebouncer(int delayMs, QObject* parent)
    : QObject(parent),
      timer_(new QTimer(this)) {
    timer_->setSingleShot(true);
    timer_->setInterval(qMax(0, delayMs));
    connect(timer_, &QTimer::timeout, this, [this]() {
        const QString search = pendingSearch_;
        pendingSearch_.clear();
        emit triggered(search);
    });
}

void SearchDebouncer::schedule(const QString& search) {
    if (timer_->isActive()) {
        Telemetry::instance().incrementCounter("search.debounce_coalesced");
    }
    pendingSearch_ = search;
    timer_->start();
}

void SearchDebouncer::cancel() {
    timer_->stop();
    pendingSearch_.clear();
}

void SearchDebouncer::setDelayMs(int delayMs) {
    timer_->setInterval(qMax(0, delayMs));
}

}  // namespace dockpulse
