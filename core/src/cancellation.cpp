#include "cancellation.hpp"
#include "exceptions.hpp"

namespace core {

    void CancellationToken::throwIfCancellationRequested() const {
        if (isCancellationRequested()) {
            throw OperationCancelledException("Operation was cancelled.");
        }
    }

} // namespace core
