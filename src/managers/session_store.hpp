#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Preferences and identifier of one interactive session.
class SessionStore {
public:
    // Fresh session with a generated id ("s-" + 8 hex digits)
    SessionStore();

    // Resume an existing session
    explicit SessionStore(std::string session_id, SessionPrefs prefs = {});

    const SessionPrefs& prefs() const { return prefs_; }
    const std::string& session_id() const { return session_id_; }

    // Field-wise last-write-wins. Unset (or empty) fields in `partial`
    // leave the current value untouched, so merging twice is a no-op.
    const SessionPrefs& merge(const SessionPrefs& partial);

private:
    std::string session_id_;
    SessionPrefs prefs_;
};

// What a saved session file holds
struct SavedSession {
    std::string session_id;
    SessionPrefs prefs;
    std::string preview_url;        // "" if none
    std::string saved_at;           // ISO timestamp
};

// YAML persistence of a session so it can be resumed later:
// ~/.dipole/sessions/{session_id}.yaml
class SessionFile {
public:
    explicit SessionFile(fs::path path);

    static SessionFile for_session(const std::string& session_id);

    bool exists() const { return fs::exists(path_); }

    // Missing or corrupted files load as an empty SavedSession.
    SavedSession load() const;
    Result<void> save(const SavedSession& session) const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};
