// filefetch umbrella header
//
// Pulls in the public API needed to resolve 'file:' locators:
//   - FileProtocol / FileResponse and their configuration
//   - ProtocolResponse, Metadata, status codes and metadata key names
//   - FileSystemProbe, to substitute filesystem checks
#pragma once

// IWYU pragma: begin_exports
#include "filefetch/file-protocol-config.hpp"
#include "filefetch/file-protocol.hpp"
#include "filefetch/file-response.hpp"
#include "filefetch/filesystem-probe.hpp"
#include "filefetch/http-constants.hpp"
#include "filefetch/http-status-code.hpp"
#include "filefetch/locator.hpp"
#include "filefetch/metadata.hpp"
#include "filefetch/protocol-response.hpp"
#include "filefetch/sitemap.hpp"
// IWYU pragma: end_exports
