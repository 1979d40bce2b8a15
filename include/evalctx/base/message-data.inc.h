DECLARE_MESSAGE(ChecksFailedCheck, (), "", "evalctx has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(ConflictingToolsPaths,
                (msg::tools_version),
                "MSBuildToolsPath and MSBuildBinPath are the names of registry values and must not be localized.",
                "Toolset {tools_version} sets MSBuildToolsPath and MSBuildBinPath to different values. Remove one of "
                "them or make them equal.")
DECLARE_MESSAGE(DirectoryEnumerationFailed, (msg::path, msg::error_msg), "", "Could not list {path}: {error_msg}")
DECLARE_MESSAGE(FailedToResolveSdk,
                (msg::sdk_name, msg::version),
                "{version} is the requested version or empty when no version was requested.",
                "Could not resolve SDK \"{sdk_name}\" {version}. Every registered resolver failed:")
DECLARE_MESSAGE(FilesystemOverrideRequiresSharedPolicy,
                (),
                "'Shared' and 'Isolated' are the names of sharing policies.",
                "A filesystem override can only be supplied to an evaluation context with the Shared policy.")
DECLARE_MESSAGE(ImportNotFound,
                (msg::path, msg::pattern),
                "",
                "The imported project \"{path}\" was not found. The import was written as \"{pattern}\".")
DECLARE_MESSAGE(InternalErrorMessageContact,
                (),
                "",
                "An invariant of the evaluation context library was broken. Please report this failure together with "
                "the output above.")
DECLARE_MESSAGE(InvalidToolsetDefinition,
                (msg::value, msg::path),
                "",
                "The value \"{value}\" of the toolset definition \"{path}\" is not a string.")
DECLARE_MESSAGE(NoSdkResolvers, (), "", "No SDK resolvers are registered.")
DECLARE_MESSAGE(SdkResolverFailed, (msg::resolver_name), "", "{resolver_name} could not resolve the SDK:")
DECLARE_MESSAGE(SdkResultVersionDifferentThanReference,
                (msg::sdk_name, msg::version, msg::actual_version),
                "",
                "The SDK reference \"{sdk_name}\" version \"{version}\" was resolved to version \"{actual_version}\" "
                "instead. You could be using a different version than expected if you do not update the referenced "
                "version to match.")
DECLARE_MESSAGE(SdkVersionMismatch,
                (msg::sdk_name, msg::version, msg::old_version),
                "",
                "SDK \"{sdk_name}\" was requested at version {version}, but this evaluation context already resolved "
                "it at version {old_version}.")
DECLARE_MESSAGE(ToolsPathInSubToolset,
                (msg::tools_version, msg::sub_toolset),
                "MSBuildToolsPath is the name of a registry value and must not be localized.",
                "Sub-toolset {sub_toolset} of toolset {tools_version} sets MSBuildToolsPath. Only the toolset itself "
                "may define the tools path.")
