// Reads the overlay network configuration file (JSON).
#pragma once
#include "OidcTokenProvider.hpp"
#include "ovscp/Overlay.hpp"
#include <QString>
#include <string>

// Fills cfg and, when the file has an "oidc" object, oidc. Fields not present
// in the file leave oidc untouched.
bool loadOverlayConfig(const QString& path,
                       ovscp::OverlayConfig& cfg,
                       OidcConfig& oidc,
                       std::string& err);
