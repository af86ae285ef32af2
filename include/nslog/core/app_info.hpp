#ifndef NSLOG_APP_INFO_HPP
#define NSLOG_APP_INFO_HPP

#include "environment.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>

namespace nslog {

    /// Application metadata used in filename templates.
    struct AppInfo {
        std::string name;
        std::string version;

        AppInfo() : name("app"), version("0.0.0") {}

        AppInfo(std::string appName, std::string appVersion)
            : name(std::move(appName)), version(std::move(appVersion)) {}

        /// Read `{"name": ..., "version": ...}` from a JSON manifest. Missing
        /// or empty fields keep their defaults.
        /// Throws LoggerError(LOG_CONFIG_LOAD_FAILED) when the file cannot be
        /// read or parsed.
        static AppInfo loadManifest(const std::string& path) {
            std::ifstream in(path.c_str());
            if (!in.is_open()) {
                throw createConfigLoadError("cannot open manifest " + path);
            }

            nlohmann::json manifest;
            try {
                manifest = nlohmann::json::parse(in);
            } catch (const nlohmann::json::exception& e) {
                throw createConfigLoadError("malformed manifest " + path, &e);
            }

            AppInfo info;
            if (manifest.is_object()) {
                auto name = manifest.find("name");
                if (name != manifest.end() && name->is_string() && !name->get<std::string>().empty()) {
                    info.name = name->get<std::string>();
                }
                auto version = manifest.find("version");
                if (version != manifest.end() && version->is_string() &&
                    !version->get<std::string>().empty()) {
                    info.version = version->get<std::string>();
                }
            }
            return info;
        }

        /// Manifest at LOG_APP_MANIFEST (default package.json); defaults when
        /// it is absent or unusable.
        static AppInfo fromEnvironment(const Environment& env) {
            try {
                return loadManifest(env.get("LOG_APP_MANIFEST", "package.json"));
            } catch (const LoggerError&) {
                return AppInfo();
            }
        }
    };

} // namespace nslog

#endif // NSLOG_APP_INFO_HPP
