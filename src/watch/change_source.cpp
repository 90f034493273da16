#include "unitsync/watch/change_source.hpp"

namespace unitsync::watch {

const char* to_string(ChangeKind kind) noexcept {
    switch (kind) {
        case ChangeKind::Create: return "create";
        case ChangeKind::Write: return "write";
        case ChangeKind::Remove: return "remove";
        case ChangeKind::Rename: return "rename";
        case ChangeKind::Attribute: return "attribute";
        case ChangeKind::Overflow: return "overflow";
        case ChangeKind::Other: return "other";
    }
    return "unknown";
}

bool triggers_reconcile(ChangeKind kind) noexcept {
    switch (kind) {
        case ChangeKind::Create:
        case ChangeKind::Write:
        case ChangeKind::Remove:
        case ChangeKind::Rename:
        case ChangeKind::Overflow:
            return true;
        default:
            return false;
    }
}

} // namespace unitsync::watch
