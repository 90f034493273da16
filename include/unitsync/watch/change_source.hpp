#pragma once

#include <boost/system/error_code.hpp>

#include <functional>
#include <string>
#include <vector>

namespace unitsync::watch {

enum class ChangeKind {
    Create,
    Write,
    Remove,
    Rename,
    Attribute,
    Overflow, ///< Kernel queue overflowed, events were lost
    Other
};

const char* to_string(ChangeKind kind) noexcept;

/// Kinds that can change the desired state and therefore trigger a pass
bool triggers_reconcile(ChangeKind kind) noexcept;

struct ChangeEvent {
    ChangeKind kind = ChangeKind::Other;
    std::string name; ///< Entry name inside the watched directory, empty for the directory itself
};

/**
 * @brief Completion for ChangeSource::async_next
 *
 * operation_aborted means the source was closed; any other error is terminal.
 */
using ChangeHandler = std::function<void(const boost::system::error_code&, std::vector<ChangeEvent>)>;

/**
 * @brief Asynchronous stream of change notifications for one directory
 */
class ChangeSource {
public:
    virtual ~ChangeSource() = default;

    /// Deliver the next batch of events. At most one wait may be outstanding.
    virtual void async_next(ChangeHandler handler) = 0;

    /// Tear the source down; a pending wait completes with operation_aborted
    virtual void close() = 0;
};

} // namespace unitsync::watch
