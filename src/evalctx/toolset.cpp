#include <evalctx/base/system.h>

#include <evalctx/toolset.h>

#include <algorithm>
#include <utility>

namespace
{
    using namespace evalctx;

    Optional<std::string> find_visual_studio_version(const PropertyMap& properties)
    {
        auto it = properties.find(VisualStudioVersionPropertyName);
        if (it == properties.end())
        {
            return nullopt;
        }

        return it->second;
    }
}

namespace evalctx
{
    Optional<SubToolsetVersion> SubToolsetVersion::parse(StringView name)
    {
        if (!name.empty() && (name[0] == 'v' || name[0] == 'V'))
        {
            name = name.substr(1);
        }

        // pieces keep empty components so that "1..2" is rejected
        std::vector<StringView> pieces;
        auto first = name.begin();
        const auto last = name.end();
        for (;;)
        {
            const auto dot = std::find(first, last, '.');
            pieces.emplace_back(first, dot);
            if (dot == last)
            {
                break;
            }

            first = dot + 1;
        }

        if (pieces.size() > 4)
        {
            return nullopt;
        }

        // components that were not written stay -1, so "12.0" and "12.0.0" are different versions
        int components[4] = {0, 0, -1, -1};
        for (size_t idx = 0; idx < pieces.size(); ++idx)
        {
            auto maybe_component = Strings::strto_int(pieces[idx]);
            auto component = maybe_component.get();
            if (!component || *component < 0)
            {
                return nullopt;
            }

            components[idx] = *component;
        }

        SubToolsetVersion result;
        result.version_major = components[0];
        result.version_minor = components[1];
        result.build = components[2];
        result.revision = components[3];
        return result;
    }

    bool operator==(const SubToolsetVersion& lhs, const SubToolsetVersion& rhs) noexcept
    {
        return lhs.version_major == rhs.version_major && lhs.version_minor == rhs.version_minor &&
               lhs.build == rhs.build && lhs.revision == rhs.revision;
    }

    bool operator!=(const SubToolsetVersion& lhs, const SubToolsetVersion& rhs) noexcept { return !(lhs == rhs); }

    bool operator<(const SubToolsetVersion& lhs, const SubToolsetVersion& rhs) noexcept
    {
        if (lhs.version_major != rhs.version_major) return lhs.version_major < rhs.version_major;
        if (lhs.version_minor != rhs.version_minor) return lhs.version_minor < rhs.version_minor;
        if (lhs.build != rhs.build) return lhs.build < rhs.build;
        return lhs.revision < rhs.revision;
    }

    Toolset::Toolset(std::string tools_version,
                     Path tools_path,
                     PropertyMap properties,
                     std::vector<SubToolset> sub_toolsets,
                     PropertyMap global_properties,
                     PropertyMap environment_properties)
        : m_tools_version(std::move(tools_version))
        , m_tools_path(std::move(tools_path))
        , m_properties(std::move(properties))
        , m_sub_toolsets(std::move(sub_toolsets))
        , m_global_properties(std::move(global_properties))
        , m_environment_properties(std::move(environment_properties))
    {
    }

    Optional<const SubToolset&> Toolset::find_sub_toolset(StringView name) const
    {
        for (auto&& sub_toolset : m_sub_toolsets)
        {
            if (Strings::case_insensitive_ascii_equals(sub_toolset.name, name))
            {
                return sub_toolset;
            }
        }

        return nullopt;
    }

    Optional<const std::string&> Toolset::get_property(StringView name, StringView sub_toolset_version) const
    {
        if (auto sub_toolset = find_sub_toolset(sub_toolset_version).get())
        {
            auto it = sub_toolset->properties.find(name);
            if (it != sub_toolset->properties.end())
            {
                return it->second;
            }
        }

        auto it = m_properties.find(name);
        if (it != m_properties.end())
        {
            return it->second;
        }

        return nullopt;
    }

    Optional<std::string> Toolset::default_sub_toolset_version() const
    {
        const SubToolset* highest_versioned = nullptr;
        SubToolsetVersion highest_version;
        const SubToolset* last_unversioned = nullptr;
        for (auto&& sub_toolset : m_sub_toolsets)
        {
            auto maybe_version = SubToolsetVersion::parse(sub_toolset.name);
            if (auto version = maybe_version.get())
            {
                if (!highest_versioned || highest_version < *version)
                {
                    highest_versioned = &sub_toolset;
                    highest_version = *version;
                }
            }
            else
            {
                last_unversioned = &sub_toolset;
            }
        }

        if (highest_versioned)
        {
            return highest_versioned->name;
        }

        if (last_unversioned)
        {
            return last_unversioned->name;
        }

        return nullopt;
    }

    Optional<std::string> Toolset::generate_sub_toolset_version(const SubToolsetVersionInputs& inputs) const
    {
        for (auto properties : {&inputs.explicit_global_properties,
                                &m_global_properties,
                                &m_environment_properties,
                                &inputs.environment_properties})
        {
            auto maybe_version = find_visual_studio_version(*properties);
            if (maybe_version)
            {
                return maybe_version;
            }
        }

        if (auto solution_file_version = inputs.solution_file_version.get())
        {
            if (*solution_file_version > 1)
            {
                SubToolsetVersion wanted;
                wanted.version_major = *solution_file_version - 1;
                for (auto&& sub_toolset : m_sub_toolsets)
                {
                    if (SubToolsetVersion::parse(sub_toolset.name) == wanted)
                    {
                        return sub_toolset.name;
                    }
                }
            }
        }

        return default_sub_toolset_version();
    }

    PropertyMap environment_properties(const std::vector<std::string>& names)
    {
        PropertyMap result;
        for (auto&& name : names)
        {
            if (auto value = get_environment_variable(name))
            {
                result.emplace(name, std::move(*value.get()));
            }
        }

        return result;
    }
}
