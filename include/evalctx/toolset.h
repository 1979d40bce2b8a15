#pragma once

#include <evalctx/fwd/toolset.h>

#include <evalctx/base/optional.h>
#include <evalctx/base/path.h>
#include <evalctx/base/strings.h>
#include <evalctx/base/stringview.h>

#include <map>
#include <string>
#include <vector>

namespace evalctx
{
    // Property names compare ASCII case-insensitively.
    using PropertyMap = std::map<std::string, std::string, Strings::CaseInsensitiveAsciiLess>;

    inline constexpr StringLiteral VisualStudioVersionPropertyName = "VisualStudioVersion";

    // A parsed sub-toolset name such as "v11.0" or "12.0".
    struct SubToolsetVersion
    {
        // Accepts an optional leading 'v' or 'V' followed by 2 to 4 dot separated nonnegative integers, or by a single
        // integer N which means N.0. Components that are not written are -1 and order before 0.
        static Optional<SubToolsetVersion> parse(StringView name);

        int version_major = 0;
        int version_minor = 0;
        int build = -1;
        int revision = -1;

        friend bool operator==(const SubToolsetVersion& lhs, const SubToolsetVersion& rhs) noexcept;
        friend bool operator!=(const SubToolsetVersion& lhs, const SubToolsetVersion& rhs) noexcept;
        friend bool operator<(const SubToolsetVersion& lhs, const SubToolsetVersion& rhs) noexcept;
    };

    // A named overlay of properties on top of its toolset's properties.
    struct SubToolset
    {
        std::string name;
        PropertyMap properties;
    };

    struct SubToolsetVersionInputs
    {
        // Global properties the caller sets explicitly for this evaluation.
        PropertyMap explicit_global_properties;
        // The process environment as the caller chooses to expose it.
        PropertyMap environment_properties;
        // The format version of the solution file the project is built from, if any. A solution at version N prefers
        // sub-toolset (N - 1).0.
        Optional<int> solution_file_version;
    };

    struct Toolset
    {
        Toolset(std::string tools_version,
                Path tools_path,
                PropertyMap properties,
                std::vector<SubToolset> sub_toolsets = {},
                PropertyMap global_properties = {},
                PropertyMap environment_properties = {});

        const std::string& tools_version() const noexcept { return m_tools_version; }
        const Path& tools_path() const noexcept { return m_tools_path; }
        const PropertyMap& properties() const noexcept { return m_properties; }
        const std::vector<SubToolset>& sub_toolsets() const noexcept { return m_sub_toolsets; }
        const PropertyMap& global_properties() const noexcept { return m_global_properties; }
        const PropertyMap& environment_properties() const noexcept { return m_environment_properties; }

        Optional<const SubToolset&> find_sub_toolset(StringView name) const;

        // The sub-toolset's value when it defines `name` (even as an empty string), otherwise the toolset's value.
        Optional<const std::string&> get_property(StringView name, StringView sub_toolset_version) const;

        // The sub-toolset with the highest version; names that are not versions rank below every version and among
        // themselves by definition order. nullopt when there are no sub-toolsets.
        Optional<std::string> default_sub_toolset_version() const;

        // Chooses the sub-toolset version for an evaluation. The first of these wins:
        //  1. VisualStudioVersion in inputs.explicit_global_properties
        //  2. VisualStudioVersion in this toolset's global properties, then its environment properties, then
        //     inputs.environment_properties
        //  3. the sub-toolset whose version is (inputs.solution_file_version - 1).0
        //  4. default_sub_toolset_version()
        // The result of 1 and 2 need not name an existing sub-toolset.
        Optional<std::string> generate_sub_toolset_version(const SubToolsetVersionInputs& inputs) const;

    private:
        std::string m_tools_version;
        Path m_tools_path;
        PropertyMap m_properties;
        std::vector<SubToolset> m_sub_toolsets;
        PropertyMap m_global_properties;
        PropertyMap m_environment_properties;
    };

    // Snapshots the named environment variables that are set into a PropertyMap.
    PropertyMap environment_properties(const std::vector<std::string>& names);
}
