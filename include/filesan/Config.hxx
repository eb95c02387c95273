// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Loading custom rule sets from YAML.
 */

#pragma once

namespace YAML { class Node; }

namespace Filesan {

class RuleSet;

/**
 * Build a #RuleSet from a YAML map.  Recognized keys: "base",
 * "escape_char", "max_length", "forbidden_chars",
 * "forbidden_ranges", "forbidden_trailing", "reserved_names",
 * "reserved_exact_names".
 *
 * Throws #ConfigurationError on error.
 */
RuleSet
LoadRuleSet(const YAML::Node &node);

/**
 * Throws #ConfigurationError (with the yaml-cpp exception nested) on
 * error.
 */
RuleSet
LoadRuleSetFile(const char *path);

} // namespace Filesan
