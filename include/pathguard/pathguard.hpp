/**
 * pathguard
 * =========
 * Bounds untrusted file paths and template names to operator-configured
 * roots before any filesystem access.
 *
 *   auto root = pathguard::TrustedRoot::open("/data/uploads");   // startup
 *   pathguard::BoundedPathResolver resolver(*root.root, &audit_log);
 *   auto r = resolver.resolve(stored_file_path);                 // per request
 *   if (r.ok) { auto bytes = pathguard::read_resolved_file(*r.path); }
 */

#pragma once

#include "pathguard/audit.hpp"
#include "pathguard/config.hpp"
#include "pathguard/file_server.hpp"
#include "pathguard/name_token.hpp"
#include "pathguard/path_resolver.hpp"
#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"
#include "pathguard/template_locator.hpp"
#include "pathguard/trusted_root.hpp"
#include "pathguard/types.hpp"

#ifndef PATHGUARD_VERSION
#define PATHGUARD_VERSION "0.1.0"
#endif
