#include <evalctx/base/messages.h>
#include <evalctx/base/strings.h>
#include <evalctx/base/system.debug.h>

#include <evalctx/toolsetreader.h>

namespace
{
    using namespace evalctx;

    ExpectedL<Optional<std::string>> read_string_value(const ToolsetDefinitionKey& key, StringView value_name)
    {
        auto maybe_value = key.get_value(value_name);
        if (auto value = maybe_value.get())
        {
            if (value->kind != ToolsetValueKind::String)
            {
                return msg::format_error(
                    msgInvalidToolsetDefinition, msg::value = value_name, msg::path = key.location());
            }

            return Optional<std::string>{std::move(value->text)};
        }

        return Optional<std::string>{};
    }

    struct ToolsetProperties
    {
        Optional<std::string> tools_path;
        Optional<std::string> bin_path;
        PropertyMap properties;
    };

    ExpectedL<ToolsetProperties> read_properties(const ToolsetDefinitionKey& key)
    {
        ToolsetProperties result;
        for (auto&& value_name : key.value_names())
        {
            auto maybe_text = read_string_value(key, value_name);
            auto text = maybe_text.get();
            if (!text)
            {
                return std::move(maybe_text).error();
            }

            auto s = text->get();
            if (!s)
            {
                continue;
            }

            if (Strings::case_insensitive_ascii_equals(value_name, MSBuildToolsPathValueName))
            {
                result.tools_path = std::move(*s);
            }
            else if (Strings::case_insensitive_ascii_equals(value_name, MSBuildBinPathValueName))
            {
                result.bin_path = std::move(*s);
            }
            else
            {
                result.properties.insert_or_assign(value_name, std::move(*s));
            }
        }

        return result;
    }

    // Returns nullopt for a toolset that has no tools path
    ExpectedL<Optional<Toolset>> read_toolset(const ToolsetDefinitionKey& tools_versions_key,
                                              const std::string& tools_version,
                                              const PropertyMap& global_properties,
                                              const PropertyMap& environment_properties)
    {
        auto toolset_key = tools_versions_key.open_subkey(tools_version);
        if (!toolset_key)
        {
            Debug::println("Toolset ", tools_version, " disappeared while reading");
            return Optional<Toolset>{};
        }

        auto maybe_properties = read_properties(*toolset_key);
        auto properties = maybe_properties.get();
        if (!properties)
        {
            return std::move(maybe_properties).error();
        }

        std::vector<SubToolset> sub_toolsets;
        for (auto&& sub_toolset_name : toolset_key->subkey_names())
        {
            auto sub_toolset_key = toolset_key->open_subkey(sub_toolset_name);
            if (!sub_toolset_key)
            {
                continue;
            }

            auto maybe_sub_properties = read_properties(*sub_toolset_key);
            auto sub_properties = maybe_sub_properties.get();
            if (!sub_properties)
            {
                return std::move(maybe_sub_properties).error();
            }

            if (sub_properties->tools_path || sub_properties->bin_path)
            {
                return msg::format_error(
                    msgToolsPathInSubToolset, msg::tools_version = tools_version, msg::sub_toolset = sub_toolset_name);
            }

            sub_toolsets.push_back(SubToolset{sub_toolset_name, std::move(sub_properties->properties)});
        }

        const auto tools_path = properties->tools_path.get();
        const auto bin_path = properties->bin_path.get();
        if ((!tools_path || tools_path->empty()) && (!bin_path || bin_path->empty()))
        {
            Debug::println("Skipping toolset ", tools_version, " because it does not define ", MSBuildToolsPathValueName);
            return Optional<Toolset>{};
        }

        if (tools_path && bin_path && !Strings::case_insensitive_ascii_equals(*tools_path, *bin_path))
        {
            return msg::format_error(msgConflictingToolsPaths, msg::tools_version = tools_version);
        }

        std::string path = tools_path ? *tools_path : *bin_path;
        return Optional<Toolset>{Toolset{tools_version,
                                         std::move(path),
                                         std::move(properties->properties),
                                         std::move(sub_toolsets),
                                         global_properties,
                                         environment_properties}};
    }
}

namespace evalctx
{
    ExpectedL<ToolsetReadResult> read_toolsets(const ToolsetDefinitionKey& tools_versions_key,
                                               const ToolsetDefinitionKey* current_version_key,
                                               const PropertyMap& global_properties,
                                               const PropertyMap& environment_properties)
    {
        ToolsetReadResult result;
        for (auto&& tools_version : tools_versions_key.subkey_names())
        {
            auto maybe_toolset =
                read_toolset(tools_versions_key, tools_version, global_properties, environment_properties);
            auto toolset = maybe_toolset.get();
            if (!toolset)
            {
                return std::move(maybe_toolset).error();
            }

            if (auto t = toolset->get())
            {
                result.toolsets.insert_or_assign(tools_version, std::move(*t));
            }
        }

        if (const auto current = current_version_key)
        {
            struct
            {
                StringLiteral name;
                Optional<std::string>& target;
            } const settings[] = {
                {DefaultToolsVersionValueName, result.default_tools_version},
                {OverrideTasksPathValueName, result.override_tasks_path},
                {DefaultOverrideToolsVersionValueName, result.default_override_tools_version},
            };

            for (auto&& setting : settings)
            {
                auto maybe_value = read_string_value(*current, setting.name);
                auto value = maybe_value.get();
                if (!value)
                {
                    return std::move(maybe_value).error();
                }

                setting.target = std::move(*value);
            }
        }

        return result;
    }
}
