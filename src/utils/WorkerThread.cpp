#include "WorkerThread.hpp"

#include <QMetaObject>


WorkerThread::WorkerThread() : m_context(std::make_unique<QObject>()) {
    m_thread.setObjectName("tally-listeners");
    m_context->moveToThread(&m_thread);
    m_thread.start();
}

WorkerThread::~WorkerThread() {
    stop();
}

void WorkerThread::adopt(QObject *object) {
    object->moveToThread(&m_thread);
}

void WorkerThread::drain() {
    if (!m_thread.isRunning()) {
        return;
    }

    QMetaObject::invokeMethod(m_context.get(), []() {}, Qt::BlockingQueuedConnection);
}

void WorkerThread::stop() {
    if (!m_thread.isRunning()) {
        return;
    }

    drain();
    m_thread.quit();
    m_thread.wait();
}
