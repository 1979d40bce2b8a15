#include <evalctx-test/util.h>

namespace evalctx::Test
{
    void CapturingMessageSink::println(Color, const LocalizedString& s)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_lines.push_back(s.data());
    }

    std::vector<std::string> CapturingMessageSink::lines() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_lines;
    }

    static Path internal_base_temporary_directory() { return "/tmp/evalctx-test"; }

    const Path& base_temporary_directory() noexcept
    {
        const static Path BASE_TEMPORARY_DIRECTORY = internal_base_temporary_directory();
        return BASE_TEMPORARY_DIRECTORY;
    }
}
