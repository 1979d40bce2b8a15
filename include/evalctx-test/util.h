#pragma once

#include <catch2/catch.hpp>

#include <evalctx/base/fwd/files.h>

#include <evalctx/base/files.h>
#include <evalctx/base/fmt.h>
#include <evalctx/base/message_sinks.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/strings.h>

#include <evalctx/pathnormalizer.h>
#include <evalctx/sdkresolution.h>

#include <iomanip>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<evalctx::LocalizedString>
    {
        static const std::string convert(const evalctx::LocalizedString& value) { return "LL\"" + value.data() + "\""; }
    };

    template<>
    struct StringMaker<evalctx::Path>
    {
        static const std::string convert(const evalctx::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<>
    struct StringMaker<evalctx::GlobCacheKey>
    {
        static const std::string convert(const evalctx::GlobCacheKey& value) { return value.to_string(); }
    };

    template<>
    struct StringMaker<evalctx::SdkReference>
    {
        static const std::string convert(const evalctx::SdkReference& value) { return value.to_string(); }
    };

    template<>
    struct StringMaker<evalctx::SdkResult>
    {
        static const std::string convert(const evalctx::SdkResult& value)
        {
            return fmt::format("{}@{}", value.path, value.version);
        }
    };
}

namespace evalctx
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace evalctx::Test
{
    // Records every line written to it; safe to share between threads.
    struct CapturingMessageSink final : MessageSink
    {
        virtual void println(Color c, const LocalizedString& s) override;
        using MessageSink::println;

        std::vector<std::string> lines() const;

    private:
        mutable std::mutex m_mutex;
        std::vector<std::string> m_lines;
    };

    template<class R1, class R2>
    void check_ranges(const R1& r1, const R2& r2)
    {
        CHECK(r1.size() == r2.size());
        auto it1 = r1.begin();
        auto e1 = r1.end();
        auto it2 = r2.begin();
        auto e2 = r2.end();
        for (; it1 != e1 && it2 != e2; ++it1, ++it2)
        {
            CHECK(*it1 == *it2);
        }
    }

    const Path& base_temporary_directory() noexcept;
}
