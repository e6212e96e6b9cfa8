#include "glacierup/errors.hpp"

namespace glacierup {

const char* remote_state_to_string(RemoteState state) {
    switch (state) {
        case RemoteState::NotApplicable: return "not-applicable";
        case RemoteState::NothingCreated: return "nothing-created";
        case RemoteState::SessionOpen: return "session-open";
        case RemoteState::SessionAborted: return "session-aborted";
        case RemoteState::AbortFailed: return "abort-failed";
    }
    return "unknown";
}

std::string GlacierError::describe() const {
    std::string msg = what();
    switch (remote_state_) {
        case RemoteState::NotApplicable:
            if (!resource_id_.empty()) msg += " (job id: " + resource_id_ + ")";
            break;
        case RemoteState::NothingCreated:
            msg += "\nNothing was created remotely.";
            break;
        case RemoteState::SessionOpen:
            msg += "\nA multipart upload exists remotely and was left open (upload id: " +
                   resource_id_ + "). Resume it with --upload-id or remove it with "
                   "abort-upload.";
            break;
        case RemoteState::SessionAborted:
            msg += "\nA multipart upload existed remotely and was aborted (upload id: " +
                   resource_id_ + ").";
            break;
        case RemoteState::AbortFailed:
            msg += "\nA multipart upload exists remotely and aborting it also failed. "
                   "Manual cleanup is required: run abort-upload with upload id " +
                   resource_id_ + ".";
            break;
    }
    return msg;
}

} // namespace glacierup
