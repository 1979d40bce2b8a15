#pragma once

#if defined(_WIN32)
#define EVALCTX_PREFERRED_SEPARATOR "\\"
#else // ^^^ _WIN32 / !_WIN32 vvv
#define EVALCTX_PREFERRED_SEPARATOR "/"
#endif // _WIN32

namespace evalctx
{
    enum class FileType
    {
        none,
        not_found,
        regular,
        directory,
        symlink,

        block,
        character,

        fifo,
        socket,
        unknown,
    };

    struct Path;
    struct DirectoryEntry;
    struct ReadOnlyFilesystem;
    struct Filesystem;

    extern const Filesystem& real_filesystem;
}
