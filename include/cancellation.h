#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <atomic>

namespace MediaVault {

// Petición de parada cooperativa; se consulta entre archivos
class CancellationToken {
public:
    CancellationToken() : m_cancelled(false) {}

    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }
    void reset() { m_cancelled.store(false); }

private:
    std::atomic<bool> m_cancelled;
};

} // namespace MediaVault

#endif // CANCELLATION_H
