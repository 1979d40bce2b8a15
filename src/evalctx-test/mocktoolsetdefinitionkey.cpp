#include <evalctx-test/mocktoolsetdefinitionkey.h>

#include <evalctx/base/strings.h>

#include <algorithm>

namespace evalctx::Test
{
    MockToolsetDefinitionKey::MockToolsetDefinitionKey(std::string location)
        : m_node(std::make_shared<Node>(Node{std::move(location), {}, {}}))
    {
    }

    MockToolsetDefinitionKey::MockToolsetDefinitionKey(std::shared_ptr<Node> node) : m_node(std::move(node)) { }

    MockToolsetDefinitionKey& MockToolsetDefinitionKey::set_string(StringView value_name, StringView text)
    {
        return set_value(value_name, ToolsetValueKind::String, text);
    }

    MockToolsetDefinitionKey& MockToolsetDefinitionKey::set_value(StringView value_name,
                                                                  ToolsetValueKind kind,
                                                                  StringView text)
    {
        auto& values = m_node->values;
        auto it = std::find_if(values.begin(), values.end(), [&](const auto& value) {
            return Strings::case_insensitive_ascii_equals(value.first, value_name);
        });
        if (it == values.end())
        {
            values.emplace_back(value_name.to_string(), ToolsetDefinitionValue{kind, text.to_string()});
        }
        else
        {
            it->second = ToolsetDefinitionValue{kind, text.to_string()};
        }

        return *this;
    }

    MockToolsetDefinitionKey MockToolsetDefinitionKey::add_subkey(StringView subkey_name)
    {
        auto child = std::make_shared<Node>(Node{Strings::concat(m_node->location, '\\', subkey_name), {}, {}});
        m_node->subkeys.emplace_back(subkey_name.to_string(), child);
        return MockToolsetDefinitionKey{std::move(child)};
    }

    std::string MockToolsetDefinitionKey::location() const { return m_node->location; }

    std::vector<std::string> MockToolsetDefinitionKey::value_names() const
    {
        std::vector<std::string> result;
        for (auto&& value : m_node->values)
        {
            result.push_back(value.first);
        }

        return result;
    }

    Optional<ToolsetDefinitionValue> MockToolsetDefinitionKey::get_value(StringView value_name) const
    {
        for (auto&& value : m_node->values)
        {
            if (Strings::case_insensitive_ascii_equals(value.first, value_name))
            {
                return value.second;
            }
        }

        return nullopt;
    }

    std::vector<std::string> MockToolsetDefinitionKey::subkey_names() const
    {
        std::vector<std::string> result;
        for (auto&& subkey : m_node->subkeys)
        {
            result.push_back(subkey.first);
        }

        return result;
    }

    std::unique_ptr<ToolsetDefinitionKey> MockToolsetDefinitionKey::open_subkey(StringView subkey_name) const
    {
        for (auto&& subkey : m_node->subkeys)
        {
            if (Strings::case_insensitive_ascii_equals(subkey.first, subkey_name))
            {
                return std::unique_ptr<ToolsetDefinitionKey>(new MockToolsetDefinitionKey(subkey.second));
            }
        }

        return nullptr;
    }
}
