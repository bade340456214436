/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "ExtensionBundleWriter.h"

#include <cctype>
#include <ctime>
#include "Core/Errors.h"
#include "IFileSystemBackend.h"
#include "Logging/Logger.h"

namespace Palisade::Core::IO {

namespace {
    constexpr uint32_t FileMode = 0644;
    constexpr uint32_t DirectoryMode = 0755;

    std::tm utcNow() {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        gmtime_r(&now, &tm);
        return tm;
    }

    std::string isoDate() {
        auto tm = utcNow();
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
        return buf;
    }

    std::string currentYear() {
        return std::to_string(utcNow().tm_year + 1900);
    }

    std::string toLower(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return out;
    }

    std::string toUpper(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        return out;
    }

    std::string packageNameOf(const Security::SanitizedThemeFields& fields) {
        auto name = ExtensionBundleWriter::toPackageName(fields.name);
        return name.empty() ? std::string("theme") : name;
    }

    std::string serialize(const Json::Value& value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, value) + "\n";
    }

    std::string colorOr(const ThemeColors& colors, const char* key, const std::string& fallback) {
        auto it = colors.find(key);
        return it != colors.end() ? it->second : fallback;
    }

    Json::Value tokenColor(const char* name, std::initializer_list<const char*> scopes, const std::string& foreground) {
        Json::Value token(Json::objectValue);
        if (name) {
            token["name"] = name;
            Json::Value scope(Json::arrayValue);
            for (const char* s : scopes) scope.append(s);
            token["scope"] = scope;
        }
        token["settings"]["foreground"] = foreground;
        return token;
    }
}

ExtensionBundleWriter::ExtensionBundleWriter(Core::Config::Defaults defaults, ThemeMapper mapper)
    : _defaults(std::move(defaults))
    , _mapper(std::move(mapper)) {
    if (!_mapper) {
        _mapper = &ExtensionBundleWriter::defaultThemeMapping;
    }
}

std::string ExtensionBundleWriter::toPackageName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        bool keep = (lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '-';
        char next = keep ? lc : '-';
        if (next == '-' && !out.empty() && out.back() == '-') {
            continue;
        }
        out.push_back(next);
    }
    while (!out.empty() && out.front() == '-') out.erase(out.begin());
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

std::string ExtensionBundleWriter::themeFileName(std::string_view name) {
    auto package = toPackageName(name);
    if (package.empty()) package = "theme";
    return package + "-color-theme.json";
}

std::string ExtensionBundleWriter::versionOf(const Security::SanitizedThemeFields& fields) const {
    return fields.version.empty() ? _defaults.themeVersion : fields.version;
}

std::string ExtensionBundleWriter::licenseOf(const Security::SanitizedThemeFields& fields) const {
    return fields.license.empty() ? _defaults.license : fields.license;
}

Json::Value ExtensionBundleWriter::defaultThemeMapping(const std::string& themeName, const ThemeColors& colors) {
    static const std::pair<const char*, std::vector<const char*>> basicMappings[] = {
        {"background", {"editor.background", "terminal.background"}},
        {"foreground", {"editor.foreground", "terminal.foreground"}},
        {"cursor", {"editorCursor.foreground", "terminalCursor.foreground"}},
        {"selection_background", {"editor.selectionBackground", "terminal.selectionBackground"}},
        {"selection_foreground", {"editor.selectionForeground"}},
    };
    static const char* const terminalColors[16] = {
        "terminal.ansiBlack", "terminal.ansiRed", "terminal.ansiGreen", "terminal.ansiYellow",
        "terminal.ansiBlue", "terminal.ansiMagenta", "terminal.ansiCyan", "terminal.ansiWhite",
        "terminal.ansiBrightBlack", "terminal.ansiBrightRed", "terminal.ansiBrightGreen", "terminal.ansiBrightYellow",
        "terminal.ansiBrightBlue", "terminal.ansiBrightMagenta", "terminal.ansiBrightCyan", "terminal.ansiBrightWhite"
    };

    Json::Value theme(Json::objectValue);
    theme["name"] = themeName;
    theme["type"] = "dark";

    Json::Value mapped(Json::objectValue);
    for (const auto& [source, targets] : basicMappings) {
        auto it = colors.find(source);
        if (it == colors.end()) continue;
        for (const char* target : targets) {
            mapped[target] = it->second;
        }
    }
    for (int i = 0; i < 16; ++i) {
        auto it = colors.find("color" + std::to_string(i));
        if (it != colors.end()) {
            mapped[terminalColors[i]] = it->second;
        }
    }
    theme["colors"] = mapped;

    Json::Value tokens(Json::arrayValue);
    tokens.append(tokenColor(nullptr, {}, colorOr(colors, "foreground", "#ffffff")));
    tokens.append(tokenColor("Comment", {"comment", "punctuation.definition.comment"},
                             colorOr(colors, "color8", colorOr(colors, "color0", "#6a6a6a"))));
    tokens.append(tokenColor("String", {"string"}, colorOr(colors, "color2", "#98c379")));
    tokens.append(tokenColor("Number", {"constant.numeric"}, colorOr(colors, "color1", "#d19a66")));
    tokens.append(tokenColor("Keyword", {"keyword"}, colorOr(colors, "color4", "#c678dd")));
    theme["tokenColors"] = tokens;
    return theme;
}

std::string ExtensionBundleWriter::packageJson(const Security::SanitizedThemeFields& fields) const {
    const auto packageName = packageNameOf(fields);

    Json::Value pkg(Json::objectValue);
    pkg["name"] = packageName;
    pkg["displayName"] = fields.name;
    pkg["description"] = fields.description.empty()
        ? "**" + fields.name + "** is a carefully crafted VS Code theme converted from a Ghostty terminal theme. "
          "It features thoughtful color choices and excellent readability for extended coding sessions."
        : fields.description;
    pkg["version"] = versionOf(fields);
    pkg["engines"]["vscode"] = "^1.102.0";

    Json::Value categories(Json::arrayValue);
    categories.append("Themes");
    pkg["categories"] = categories;

    Json::Value keywords(Json::arrayValue);
    keywords.append("theme");
    keywords.append("dark theme");
    keywords.append("color theme");
    keywords.append(toLower(fields.name));
    pkg["keywords"] = keywords;

    Json::Value contribution(Json::objectValue);
    contribution["label"] = fields.name;
    contribution["uiTheme"] = "vs-dark";
    contribution["path"] = "./themes/" + themeFileName(fields.name);
    pkg["contributes"]["themes"].append(contribution);

    if (!fields.publisher.empty()) {
        const auto repo = "https://github.com/" + fields.publisher + "/" + packageName;
        pkg["publisher"] = fields.publisher;
        pkg["repository"]["type"] = "git";
        pkg["repository"]["url"] = repo;
        pkg["bugs"]["url"] = repo + "/issues";
        pkg["homepage"] = repo + "#readme";
    }
    pkg["license"] = licenseOf(fields);
    return serialize(pkg);
}

std::string ExtensionBundleWriter::themeJson(const Security::SanitizedThemeFields& fields,
                                             const ThemeColors& colors) const {
    return serialize(_mapper(fields.name, colors));
}

std::string ExtensionBundleWriter::readme(const Security::SanitizedThemeFields& fields) const {
    const auto packageName = packageNameOf(fields);
    const auto installId = fields.publisher.empty() ? packageName : fields.publisher + "." + packageName;
    const auto issues = fields.publisher.empty()
        ? std::string("#")
        : "https://github.com/" + fields.publisher + "/" + packageName + "/issues";
    const auto description = fields.description.empty()
        ? std::string("A carefully crafted VS Code theme converted from a Ghostty terminal theme.")
        : fields.description;

    std::string out;
    out += "# " + fields.name + "\n\n";
    out += description + "\n\n";
    out += "## Installation\n\n";
    out += "### Via VS Code Marketplace\n";
    out += "1. Open VS Code\n";
    out += "2. Go to Extensions (Ctrl+Shift+X / Cmd+Shift+X)\n";
    out += "3. Search for \"" + fields.name + "\"\n";
    out += "4. Click Install\n\n";
    out += "### Via Command Line\n";
    out += "```bash\ncode --install-extension " + installId + "\n```\n\n";
    out += "## Usage\n\n";
    out += "1. Open Command Palette (Ctrl+Shift+P / Cmd+Shift+P)\n";
    out += "2. Type \"Preferences: Color Theme\"\n";
    out += "3. Select \"" + fields.name + "\"\n\n";
    out += "## Features\n\n";
    out += "- Carefully selected colors for optimal readability\n";
    out += "- Dark theme optimized for low-light environments\n";
    out += "- Converted from Ghostty terminal theme for consistency\n\n";
    out += "## License\n\n";
    out += licenseOf(fields) + "\n\n";
    out += "## Contributing\n\n";
    out += "Issues and pull requests are welcome! Please check the [issue tracker](" + issues +
           ") for existing issues before creating new ones.\n\n";
    out += "## Changelog\n\n";
    out += "See [CHANGELOG.md](./CHANGELOG.md) for release notes.\n";
    return out;
}

std::string ExtensionBundleWriter::changelog(const Security::SanitizedThemeFields& fields) const {
    const auto version = versionOf(fields);
    std::string out;
    out += "# Changelog\n\n";
    out += "All notable changes to the \"" + fields.name + "\" theme will be documented in this file.\n\n";
    out += "The format is based on [Keep a Changelog](https://keepachangelog.com/en/1.0.0/),\n";
    out += "and this project adheres to [Semantic Versioning](https://semver.org/spec/v2.0.0.html).\n\n";
    out += "## [" + version + "] - " + isoDate() + "\n\n";
    out += "### Added\n";
    out += "- Initial release of " + fields.name + " theme\n";
    out += "- Dark theme optimized for readability\n";
    out += "- Converted from Ghostty terminal theme for consistency\n";
    return out;
}

std::string ExtensionBundleWriter::license(const Security::SanitizedThemeFields& fields) const {
    const auto year = currentYear();
    const auto author = fields.publisher.empty() ? std::string("Theme Author") : fields.publisher;
    const auto kind = toUpper(licenseOf(fields));

    if (kind == "MIT") {
        return "MIT License\n\n"
               "Copyright (c) " + year + " " + author + "\n\n"
               "Permission is hereby granted, free of charge, to any person obtaining a copy\n"
               "of this software and associated documentation files (the \"Software\"), to deal\n"
               "in the Software without restriction, including without limitation the rights\n"
               "to use, copy, modify, merge, publish, distribute, sublicense, and/or sell\n"
               "copies of the Software, and to permit persons to whom the Software is\n"
               "furnished to do so, subject to the following conditions:\n\n"
               "The above copyright notice and this permission notice shall be included in all\n"
               "copies or substantial portions of the Software.\n\n"
               "THE SOFTWARE IS PROVIDED \"AS IS\", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR\n"
               "IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,\n"
               "FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE\n"
               "AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER\n"
               "LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,\n"
               "OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE\n"
               "SOFTWARE.\n";
    }
    if (kind == "ISC") {
        return "ISC License\n\n"
               "Copyright (c) " + year + " " + author + "\n\n"
               "Permission to use, copy, modify, and/or distribute this software for any\n"
               "purpose with or without fee is hereby granted, provided that the above\n"
               "copyright notice and this permission notice appear in all copies.\n\n"
               "THE SOFTWARE IS PROVIDED \"AS IS\" AND THE AUTHOR DISCLAIMS ALL WARRANTIES\n"
               "WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF\n"
               "MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR\n"
               "ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES\n"
               "WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN\n"
               "ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF\n"
               "OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.\n";
    }
    return "Copyright (c) " + year + " " + author + "\n\nAll rights reserved.\n";
}

std::vector<ExtensionBundleWriter::Artifact>
ExtensionBundleWriter::render(const Security::SanitizedThemeFields& fields, const ThemeColors& colors) const {
    if (fields.name.empty()) {
        throw ValidationError("Theme name is required");
    }
    std::vector<Artifact> artifacts;
    artifacts.push_back({"package.json", "Generating package.json", packageJson(fields)});
    artifacts.push_back({"themes/" + themeFileName(fields.name), "Generating theme file", themeJson(fields, colors)});
    artifacts.push_back({"README.md", "Generating README.md", readme(fields)});
    artifacts.push_back({"CHANGELOG.md", "Generating CHANGELOG.md", changelog(fields)});
    artifacts.push_back({"LICENSE", "Generating LICENSE", license(fields)});
    return artifacts;
}

ExtensionBundleResult ExtensionBundleWriter::write(IFileSystemBackend& backend,
                                                   const Security::ValidatedPath& outputDir,
                                                   const Security::SanitizedThemeFields& fields,
                                                   const ThemeColors& colors,
                                                   const ProgressCallback& onProgress,
                                                   const CancellationToken& token) const {
    auto artifacts = render(fields, colors);

    ExtensionBundleResult result;
    result.outputDir = outputDir.path();
    result.packageName = packageNameOf(fields);

    const auto themesDir = outputDir.child("themes");
    for (const auto* dir : {&outputDir, &themesDir}) {
        token.throwIfCancelled();
        backend.createDirectories(dir->path(), DirectoryMode);
        result.directories.push_back(dir->path());
    }

    const uint64_t total = artifacts.size();
    uint64_t step = 0;
    for (const auto& artifact : artifacts) {
        token.throwIfCancelled();
        if (onProgress) {
            ProgressEvent event;
            event.bytesProcessed = step;
            event.totalBytes = total;
            event.percentage = static_cast<double>(step * 100 / total);
            event.operation = artifact.label;
            event.currentFile = artifact.relativePath;
            onProgress(event);
        }

        // Artifact names are fixed; child() still refuses anything escaping outputDir
        auto target = outputDir.child(artifact.relativePath);
        backend.writeFile(target.path(), artifact.contents, FileMode);
        result.files.push_back(target.path());
        PALISADE_LOG_DEBUG_CAT("FileService", "Wrote bundle artifact " + artifact.relativePath);
        ++step;
    }

    if (onProgress) {
        ProgressEvent done;
        done.bytesProcessed = total;
        done.totalBytes = total;
        done.percentage = 100.0;
        done.operation = "Extension generation completed";
        onProgress(done);
    }
    return result;
}

} // namespace Palisade::Core::IO
