DECLARE_MSG_ARG(actual_version, "2.0.0")
DECLARE_MSG_ARG(error_msg, "File Not Found")
DECLARE_MSG_ARG(old_version, "1.0.0")
DECLARE_MSG_ARG(path, "/foo/bar")
DECLARE_MSG_ARG(pattern, "src/**/*.cs")
DECLARE_MSG_ARG(resolver_name, "DefaultSdkResolver")
DECLARE_MSG_ARG(sdk_name, "Microsoft.NET.Sdk")
DECLARE_MSG_ARG(sub_toolset, "12.0")
DECLARE_MSG_ARG(tools_version, "14.0")
DECLARE_MSG_ARG(value, "")
DECLARE_MSG_ARG(version, "1.2.3")
