// AppInfo.h
// - application identity shared by bootstrap, settings and telemetry
#pragma once

#ifndef SCOPEGUI_VERSION
#define SCOPEGUI_VERSION "0.0.0"
#endif

namespace AppInfo {
constexpr const char* kAppName    = "ScopeGUI";
constexpr const char* kOrgName    = "scopegui";
constexpr const char* kOrgDomain  = "scopegui.org";
constexpr const char* kExeName    = "scopegui";
constexpr const char* kVersion    = SCOPEGUI_VERSION;
constexpr const char* kProjectUrl = "https://github.com/scopegui/scopegui";
}
