#include "utils.h"

const char* toString(TransferState state) {
    switch (state) {
    case TransferState::Idle: return "idle";
    case TransferState::Running: return "running";
    case TransferState::Paused: return "paused";
    case TransferState::Finished: return "finished";
    case TransferState::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(TransferError error) {
    switch (error) {
    case TransferError::None: return "none";
    case TransferError::Probe: return "probe error";
    case TransferError::Network: return "network error";
    case TransferError::Write: return "write error";
    case TransferError::NoBlocks: return "no blocks";
    case TransferError::RetriesExhausted: return "retries exhausted";
    case TransferError::Dispatch: return "dispatch error";
    }
    return "unknown";
}
