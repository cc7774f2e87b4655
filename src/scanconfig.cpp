#include "scanconfig.h"

#include "typodictionary.h"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace {

const QCommandLineOption PlaintextOption({"p", "plaintext"},
                                         "Parse the files as plaintext instead of as PHP.");
const QCommandLineOption ExtensionsOption("extensions",
                                          "When analyzing folders, check for typos in files with these "
                                          "extensions. Defaults to php. If the value is empty, analyze all "
                                          "extensions.",
                                          "php,html");
const QCommandLineOption WithContextOption({"c", "with-context"},
                                           "Print the affected line alongside each issue.");
const QCommandLineOption DictionaryOption({"d", "dictionary"},
                                          "Dictionary of 'typo->correction' entries.", "file");
const QCommandLineOption IgnoreWordsOption({"i", "ignore-words"},
                                           "File with words that are never reported, one per line.", "file");
const QCommandLineOption PhysicalLinesOption("physical-lines",
                                             "Do not count newline escapes inside string literals as "
                                             "line breaks.");
const QCommandLineOption VerboseOption("verbose", "Print debug logging to stderr.");

void setupParser(QCommandLineParser *parser)
{
    parser->setApplicationDescription("Checks PHP files and folders for common typos.");
    parser->addHelpOption();
    parser->addVersionOption();
    parser->addOption(PlaintextOption);
    parser->addOption(ExtensionsOption);
    parser->addOption(WithContextOption);
    parser->addOption(DictionaryOption);
    parser->addOption(IgnoreWordsOption);
    parser->addOption(PhysicalLinesOption);
    parser->addOption(VerboseOption);
    parser->addPositionalArgument("paths", "Files or folders to analyze.", "path/to/file.php path/to/folder...");
}

} // namespace

namespace ScanConfigParser {

Result parseCommandLine(const QStringList &arguments, ScanConfig *config, QString *errorMessage)
{
    QCommandLineParser parser;
    setupParser(&parser);

    if (!parser.parse(arguments)) {
        *errorMessage = parser.errorText();
        return Result::Error;
    }
    if (parser.isSet("help") || arguments.mid(1).contains("help")) {
        return Result::HelpRequested;
    }
    if (parser.isSet("version")) {
        return Result::VersionRequested;
    }

    config->plaintext = parser.isSet(PlaintextOption);
    config->withContext = parser.isSet(WithContextOption);
    config->countEscapedNewlines = !parser.isSet(PhysicalLinesOption);
    config->verbose = parser.isSet(VerboseOption);

    if (parser.isSet(ExtensionsOption)) {
        const QString extensions = parser.value(ExtensionsOption);
        config->fileExtensions = extensions.isEmpty() ? QStringList() : extensions.split(',');
    }

    config->dictionaryPath = parser.isSet(DictionaryOption)
        ? parser.value(DictionaryOption)
        : TypoDictionary::defaultDictionaryPath();
    config->ignoreWordsFile = parser.value(IgnoreWordsOption);

    config->paths = parser.positionalArguments();
    if (config->paths.isEmpty()) {
        *errorMessage = "Expected 1 or more files or folders to analyze";
        return Result::Error;
    }
    return Result::Ok;
}

QString helpText()
{
    QCommandLineParser parser;
    setupParser(&parser);
    return parser.helpText();
}

} // namespace ScanConfigParser
