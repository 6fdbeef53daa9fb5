#include "cycle_report.hpp"
#include <algorithm>
#include <utility>

void CycleReport::record(EntryOutcome outcome) {
    outcomes_.push_back(std::move(outcome));
}

bool CycleReport::changed() const {
    return std::any_of(outcomes_.begin(), outcomes_.end(), [](const EntryOutcome& o) {
        return o.success && o.action != SyncAction::SCAN;
    });
}

size_t CycleReport::count(SyncAction action) const {
    return std::count_if(outcomes_.begin(), outcomes_.end(), [action](const EntryOutcome& o) {
        return o.success && o.action == action;
    });
}

size_t CycleReport::failures() const {
    return std::count_if(outcomes_.begin(), outcomes_.end(), [](const EntryOutcome& o) {
        return !o.success;
    });
}

const char* describe(SyncAction action) {
    switch (action) {
        case SyncAction::CREATE_DIRECTORY: return "Created directory";
        case SyncAction::COPY_FILE:        return "Copied new file";
        case SyncAction::UPDATE_FILE:      return "Updated file";
        case SyncAction::REPLACE_ENTRY:    return "Removed mismatched entry";
        case SyncAction::DELETE_FILE:      return "Deleted file";
        case SyncAction::DELETE_DIRECTORY: return "Deleted directory";
        case SyncAction::SCAN:             return "Scanned";
    }
    return "Unknown action";
}
