#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class SyncAction {
    CREATE_DIRECTORY,
    COPY_FILE,
    UPDATE_FILE,
    REPLACE_ENTRY,   // replica entry of the wrong kind removed before recreating it
    DELETE_FILE,
    DELETE_DIRECTORY,
    SCAN             // only ever recorded as a failure
};

// What happened to one entry during a cycle
struct EntryOutcome {
    SyncAction action;
    std::string path;    // absolute path the action was about
    bool success;
    std::string reason;  // empty on success

    static EntryOutcome done(SyncAction action, const std::string& path) {
        return { action, path, true, "" };
    }

    static EntryOutcome failed(SyncAction action, const std::string& path, const std::string& reason) {
        return { action, path, false, reason };
    }
};

class CycleReport {
public:
    void record(EntryOutcome outcome);

    // true when at least one mutation succeeded; failures alone never count
    bool changed() const;

    size_t count(SyncAction action) const;  // successful ones only
    size_t failures() const;

    const std::vector<EntryOutcome>& outcomes() const { return outcomes_; }

private:
    std::vector<EntryOutcome> outcomes_;
};

const char* describe(SyncAction action);
