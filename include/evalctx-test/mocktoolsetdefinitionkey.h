#pragma once

#include <evalctx/toolsetreader.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace evalctx::Test
{
    // An in-memory toolset definition tree. Copies refer to the same node, so subkeys can be filled in after they
    // were added.
    struct MockToolsetDefinitionKey final : ToolsetDefinitionKey
    {
        explicit MockToolsetDefinitionKey(std::string location);

        MockToolsetDefinitionKey& set_string(StringView value_name, StringView text);
        MockToolsetDefinitionKey& set_value(StringView value_name, ToolsetValueKind kind, StringView text);
        MockToolsetDefinitionKey add_subkey(StringView subkey_name);

        virtual std::string location() const override;
        virtual std::vector<std::string> value_names() const override;
        virtual Optional<ToolsetDefinitionValue> get_value(StringView value_name) const override;
        virtual std::vector<std::string> subkey_names() const override;
        virtual std::unique_ptr<ToolsetDefinitionKey> open_subkey(StringView subkey_name) const override;

    private:
        struct Node
        {
            std::string location;
            std::vector<std::pair<std::string, ToolsetDefinitionValue>> values;
            std::vector<std::pair<std::string, std::shared_ptr<Node>>> subkeys;
        };

        explicit MockToolsetDefinitionKey(std::shared_ptr<Node> node);

        std::shared_ptr<Node> m_node;
    };
}
