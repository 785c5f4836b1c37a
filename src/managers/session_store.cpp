#include "session_store.hpp"
#include "bridge_log.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

// ── SessionStore ────────────────────────────────────────────

SessionStore::SessionStore() : session_id_(generate_session_id()) {}

SessionStore::SessionStore(std::string session_id, SessionPrefs prefs)
    : session_id_(std::move(session_id)), prefs_(std::move(prefs)) {
    if (session_id_.empty()) session_id_ = generate_session_id();
}

static void merge_field(std::optional<std::string>& into, const std::optional<std::string>& from) {
    if (from && !from->empty()) into = *from;
}

const SessionPrefs& SessionStore::merge(const SessionPrefs& partial) {
    merge_field(prefs_.provider, partial.provider);
    merge_field(prefs_.method, partial.method);
    merge_field(prefs_.output_dir, partial.output_dir);
    merge_field(prefs_.domain, partial.domain);
    return prefs_;
}

// ── SessionFile ─────────────────────────────────────────────

SessionFile::SessionFile(fs::path path) : path_(std::move(path)) {}

SessionFile SessionFile::for_session(const std::string& session_id) {
    return SessionFile(platform::home_dir() / ".dipole" / "sessions" / (session_id + ".yaml"));
}

static void load_pref(const YAML::Node& node, const char* key, std::optional<std::string>& out) {
    if (node[key] && node[key].IsScalar()) {
        std::string v = node[key].as<std::string>("");
        if (!v.empty()) out = v;
    }
}

SavedSession SessionFile::load() const {
    SavedSession session;

    if (!fs::exists(path_)) {
        return session;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());

        session.session_id = root["session_id"].as<std::string>("");
        session.preview_url = root["preview_url"].as<std::string>("");
        session.saved_at = root["saved_at"].as<std::string>("");

        if (root["prefs"] && root["prefs"].IsMap()) {
            const auto& p = root["prefs"];
            load_pref(p, "provider", session.prefs.provider);
            load_pref(p, "method", session.prefs.method);
            load_pref(p, "output_dir", session.prefs.output_dir);
            load_pref(p, "domain", session.prefs.domain);
        }
    } catch (const std::exception& e) {
        // Corrupted session file, start fresh
        dipole_log("session: ignoring unreadable " + path_.string() + ": " + e.what());
        return SavedSession{};
    }

    return session;
}

static void emit_pref(YAML::Emitter& out, const char* key, const std::optional<std::string>& v) {
    if (v) out << YAML::Key << key << YAML::Value << *v;
}

Result<void> SessionFile::save(const SavedSession& session) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + path_.parent_path().string() + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "session_id" << YAML::Value << session.session_id;
    out << YAML::Key << "saved_at" << YAML::Value
        << (session.saved_at.empty() ? now_iso() : session.saved_at);
    out << YAML::Key << "preview_url" << YAML::Value << session.preview_url;

    out << YAML::Key << "prefs" << YAML::Value << YAML::BeginMap;
    emit_pref(out, "provider", session.prefs.provider);
    emit_pref(out, "method", session.prefs.method);
    emit_pref(out, "output_dir", session.prefs.output_dir);
    emit_pref(out, "domain", session.prefs.domain);
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        return Result<void>::Err("Failed to write session file " + path_.string());
    }
    fout << out.c_str();
    return Result<void>::Ok();
}
