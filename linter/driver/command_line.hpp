#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace escapelint
{
    struct CommandLineOptions
    {
        std::string compilerOutputPath;
        std::string packagePath{"."};
        bool noFail{false};
    };

    struct CommandLineParseResult
    {
        CommandLineOptions options;
        bool showHelp{false};
        bool showVersion{false};
        bool hasError{false};
        // Set alongside hasError when -f was not given.
        bool missingCompilerOutput{false};
        std::string errorMessage;
    };

    /**
     * Flags take one or two leading dashes. Values are given either as the
     * next argument (`-f out.txt`) or inline (`-f=out.txt`).
     */
    class CommandLineParser
    {
    public:
        CommandLineParseResult parse(int argc, char** argv) const
        {
            CommandLineParseResult result;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                // Flag parsing stops at the first positional argument; positionals are ignored.
                if (argument == "--" || argument.size() < 2 || argument[0] != '-')
                {
                    break;
                }

                std::string_view flag = argument.substr(argument.rfind("--", 0) == 0 ? 2 : 1);
                std::optional<std::string_view> inlineValue;
                const std::size_t equals = flag.find('=');
                if (equals != std::string_view::npos)
                {
                    inlineValue = flag.substr(equals + 1);
                    flag = flag.substr(0, equals);
                }

                if (flag == "h" || flag == "help")
                {
                    result.showHelp = true;
                    return result;
                }

                if (flag == "version")
                {
                    result.showVersion = true;
                    return result;
                }

                if (flag == "no-fail")
                {
                    if (inlineValue.has_value())
                    {
                        if (*inlineValue == "true" || *inlineValue == "1")
                        {
                            result.options.noFail = true;
                        }
                        else if (*inlineValue == "false" || *inlineValue == "0")
                        {
                            result.options.noFail = false;
                        }
                        else
                        {
                            result.hasError = true;
                            result.errorMessage = "invalid boolean value '" + std::string{*inlineValue} + "' for -no-fail.";
                            return result;
                        }
                    }
                    else
                    {
                        result.options.noFail = true;
                    }
                    continue;
                }

                if (flag == "f" || flag == "pkg")
                {
                    std::string value;
                    if (inlineValue.has_value())
                    {
                        value = std::string{*inlineValue};
                    }
                    else if (index + 1 < argc)
                    {
                        value = argv[++index];
                    }
                    else
                    {
                        result.hasError = true;
                        result.errorMessage = "flag needs an argument: -" + std::string{flag} + ".";
                        return result;
                    }

                    if (flag == "f")
                    {
                        result.options.compilerOutputPath = std::move(value);
                    }
                    else
                    {
                        result.options.packagePath = std::move(value);
                    }
                    continue;
                }

                result.hasError = true;
                result.errorMessage = "flag provided but not defined: -" + std::string{flag} + ".";
                return result;
            }

            if (result.options.compilerOutputPath.empty())
            {
                result.hasError = true;
                result.missingCompilerOutput = true;
                result.errorMessage = "compiler output file is required";
            }

            return result;
        }
    };
} // namespace escapelint
