#include "diagpack/collect/collection_result.hpp"

namespace diagpack {

const char* ActionKindName(ActionKind kind) {
    switch (kind) {
        case ActionKind::File:     return "File";
        case ActionKind::Registry: return "Registry";
        case ActionKind::EventLog: return "EventLog";
        case ActionKind::Command:  return "Command";
    }
    return "Unknown";
}

const char* RunOutcomeName(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::None:      return "None";
        case RunOutcome::Success:   return "Success";
        case RunOutcome::Cancelled: return "Cancelled";
        case RunOutcome::Failed:    return "Failed";
    }
    return "Unknown";
}

} // namespace diagpack
