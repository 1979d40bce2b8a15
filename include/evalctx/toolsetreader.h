#pragma once

#include <evalctx/fwd/toolset.h>

#include <evalctx/base/expected.h>
#include <evalctx/base/optional.h>
#include <evalctx/base/stringview.h>

#include <evalctx/toolset.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace evalctx
{
    struct ToolsetDefinitionValue
    {
        ToolsetValueKind kind;
        // The value as text; MultiString values are joined with '\n'.
        std::string text;
    };

    // A node of a toolset definition tree, such as a registry key. Value and subkey names compare ASCII
    // case-insensitively.
    struct ToolsetDefinitionKey
    {
        // Location of this key, used in error messages.
        virtual std::string location() const = 0;

        virtual std::vector<std::string> value_names() const = 0;
        virtual Optional<ToolsetDefinitionValue> get_value(StringView value_name) const = 0;

        virtual std::vector<std::string> subkey_names() const = 0;
        virtual std::unique_ptr<ToolsetDefinitionKey> open_subkey(StringView subkey_name) const = 0;

        virtual ~ToolsetDefinitionKey() = default;
    };

    inline constexpr StringLiteral MSBuildToolsPathValueName = "MSBuildToolsPath";
    inline constexpr StringLiteral MSBuildBinPathValueName = "MSBuildBinPath";
    inline constexpr StringLiteral DefaultToolsVersionValueName = "DefaultToolsVersion";
    inline constexpr StringLiteral OverrideTasksPathValueName = "MSBuildOverrideTasksPath";
    inline constexpr StringLiteral DefaultOverrideToolsVersionValueName = "DefaultOverrideToolsVersion";

    struct ToolsetReadResult
    {
        // Keyed by tools version.
        std::map<std::string, Toolset, Strings::CaseInsensitiveAsciiLess> toolsets;
        Optional<std::string> default_tools_version;
        Optional<std::string> override_tasks_path;
        Optional<std::string> default_override_tools_version;
    };

    // Reads one toolset per subkey of `tools_versions_key`:
    //  - MSBuildToolsPath or MSBuildBinPath set the tools path, and must agree when both are present
    //  - every other string value is a toolset property
    //  - each subkey is a sub-toolset whose string values override the toolset's properties; deeper subkeys are
    //    ignored and sub-toolsets cannot set the tools path
    //  - a toolset without a tools path is skipped
    // Values directly on `tools_versions_key` are ignored. DefaultToolsVersion, MSBuildOverrideTasksPath and
    // DefaultOverrideToolsVersion are read from `current_version_key` when it is non-null; its other values are ignored.
    // A value that is read but is not a string is an error.
    ExpectedL<ToolsetReadResult> read_toolsets(const ToolsetDefinitionKey& tools_versions_key,
                                               const ToolsetDefinitionKey* current_version_key,
                                               const PropertyMap& global_properties,
                                               const PropertyMap& environment_properties);
}
