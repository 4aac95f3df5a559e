#pragma once

#include <QObject>
#include <QThread>

#include <memory>


/**
 * Event loop thread for change listeners that do I/O. Adopted objects must
 * have no parent and must outlive the thread; stop() (or the destructor)
 * handles everything already posted before it quits.
 */
class WorkerThread {
public:
    WorkerThread();

    ~WorkerThread();

    WorkerThread(const WorkerThread &other) = delete;

    WorkerThread &operator=(const WorkerThread &other) = delete;

    void adopt(QObject *object);

    // Blocks until every event posted to the thread before the call is handled.
    void drain();

    void stop();

    [[nodiscard]] QThread *thread() {
        return &m_thread;
    }

private:
    QThread m_thread;
    std::unique_ptr<QObject> m_context;
};
