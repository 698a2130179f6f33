#include "progresstracker.h"
#include <QtMath>

const double ProgressTracker::kPercentCap = 0.99;
const double ProgressTracker::kMinimumRate = 1.0;

ProgressTracker::ProgressTracker(qint64 totalBytesEstimate)
{
    reset(totalBytesEstimate);
}

void ProgressTracker::reset(qint64 totalBytesEstimate)
{
    m_samples.clear();
    m_totalBytesEstimate = qMax<qint64>(0, totalBytesEstimate);
    m_bytes = 0;
    m_rate = 0.0;
    m_completed = false;
    m_stopped = false;
}

ProgressSnapshot ProgressTracker::onEvent(const TransferEvent &event)
{
    switch (event.type) {
    case TransferEvent::BytesProgress:
        if (!m_stopped) {
            addSample(event.timestampMs, event.bytes);
        }
        break;
    case TransferEvent::EntrySkipped:
        break;
    case TransferEvent::Completed:
        if (event.bytes > m_bytes) {
            m_bytes = event.bytes;
        }
        m_completed = true;
        m_stopped = true;
        break;
    case TransferEvent::Failed:
    case TransferEvent::Cancelled:
        m_rate = 0.0;
        m_stopped = true;
        break;
    }

    return snapshot();
}

void ProgressTracker::addSample(qint64 timestampMs, qint64 bytes)
{
    ProgressSample sample;
    sample.timestampMs = timestampMs;
    sample.bytes = qMax<qint64>(0, bytes);

    m_samples.enqueue(sample);
    while (m_samples.size() > kMaxSamples) {
        m_samples.dequeue();
    }

    m_bytes = sample.bytes;
    m_rate = computeRate();
}

double ProgressTracker::computeRate() const
{
    if (m_samples.size() < 2)
        return 0.0;

    const ProgressSample &oldest = m_samples.head();
    const ProgressSample &newest = m_samples.last();

    qint64 elapsedMs = newest.timestampMs - oldest.timestampMs;
    qint64 deltaBytes = newest.bytes - oldest.bytes;
    if (elapsedMs <= 0 || deltaBytes <= 0)
        return 0.0;

    return deltaBytes * 1000.0 / elapsedMs;
}

ProgressSnapshot ProgressTracker::snapshot() const
{
    ProgressSnapshot snap;
    snap.bytesTransferred = m_bytes;
    snap.totalBytesEstimate = m_totalBytesEstimate;
    snap.rateBytesPerSec = m_stopped ? (m_completed ? m_rate : 0.0) : m_rate;
    snap.finished = m_stopped;

    if (m_completed) {
        snap.percent = 1.0;
        snap.percentKnown = true;
        snap.etaSeconds = 0;
        return snap;
    }

    if (m_totalBytesEstimate > 0) {
        double fraction = static_cast<double>(m_bytes) / m_totalBytesEstimate;
        snap.percent = qBound(0.0, fraction, kPercentCap);
        snap.percentKnown = true;
    }

    if (!m_stopped && m_totalBytesEstimate > 0 && m_samples.size() >= 2 && m_rate >= kMinimumRate) {
        qint64 remaining = qMax<qint64>(0, m_totalBytesEstimate - m_bytes);
        snap.etaSeconds = static_cast<qint64>(qCeil(remaining / m_rate));
    }

    return snap;
}
