#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../cad/DesignRequest.hpp"

namespace partforge::io {

/**
 * @brief Validate a request document and resolve its defaults
 *
 * Everything a build needs to know is checked here, before any kernel
 * exists: operation types, units, engine names, vector shapes, positive
 * sizes, indices in [0, INT_MAX] and counts in [1, cad::kMaxFeatureCount]. Any violation
 * is a VALIDATION_ERROR naming the offending field.
 *
 * Tool types are left as text and checked when the operation runs.
 */
cad::Result<cad::DesignRequest> parseDesignRequest(const nlohmann::json& doc);

/// Same, from JSON text. Malformed JSON is a VALIDATION_ERROR.
cad::Result<cad::DesignRequest> parseDesignRequest(const std::string& text);

/// Parse one entry of the "operations" array.
cad::Result<cad::Operation> parseOperation(const nlohmann::json& entry);

} // namespace partforge::io
