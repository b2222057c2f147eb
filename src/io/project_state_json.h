#pragma once

#include "core/project_state.h"

#include <nlohmann/json.hpp>

#include <string>

// kaku::ProjectState <-> nlohmann::json.
// Used by the .kaku project IO layer; the same document is stored as zstd/CBOR
// or read back from plain JSON.
namespace project_state_json
{
using json = nlohmann::json;

// Always writes the current document version.
json ToJson(const kaku::ProjectState& st);

// Accepts the current version and legacy versions 1..3 (see implementation).
// Rejects documents newer than kaku::ProjectState::kCurrentVersion.
bool FromJson(const json& j, kaku::ProjectState& out, std::string& err);

// Cell-level helpers, exposed for tests and the CLI.
json CellToJson(const kaku::Cell& c);
bool CellFromJson(const json& j, kaku::Cell& out, std::string& err);
} // namespace project_state_json
