
#include "ProgramCache.h"
#include "Regex.h"
#include "Settings.h"
#include "Util/version.h"

#include <QCoreApplication>
#include <QString>
#include <QStringList>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gsl/gsl>

namespace {

constexpr int ExitMatched = 0;
constexpr int ExitNoMatch = 1;
constexpr int ExitTrouble = 2;

constexpr const char UsageMessage[] = "Usage: regvm [-backtrack | -parallel] [-prefix | -full] [-steps n]\n"
									  "             [-config file] [-describe] [-count] [-invert]\n"
									  "             [-V | -version] [-h | -help]\n"
									  "             [-e pattern]... [--] pattern [file...]\n";

struct CommandLine {
	std::vector<std::string> patterns;
	QStringList files;
	QString configFile;
	std::optional<RegVM::Strategy> strategy;
	std::optional<RegVM::Anchoring> anchoring;
	std::optional<size_t> stepLimit;
	bool describe = false;
	bool count    = false;
	bool invert   = false;
};

/**
 * @brief Gets the index of the next argument parameter.
 *
 * @param args The command line arguments.
 * @param argIndex The current argument index.
 * @return The next argument index.
 */
int GetArgumentParameter(const QStringList &args, int argIndex) {
	if (argIndex + 1 >= args.size()) {
		fprintf(stderr, "regvm: %s requires an argument\n%s", qPrintable(args[argIndex]), UsageMessage);
		exit(ExitTrouble);
	}

	return ++argIndex;
}

/**
 * @brief Prints the version information of regvm.
 */
void PrintVersion() {
	static constexpr const char helpText[] = "regvm Version %d.%d\n";
	printf(helpText, REGVM_VERSION_MAJ, REGVM_VERSION_REV);
}

/**
 * @brief Parses the command line arguments into a CommandLine structure.
 *
 * @param args The command line arguments
 * @return A CommandLine structure containing the parsed arguments
 *         or an empty optional if the command line is invalid.
 */
std::optional<CommandLine> ParseCommandLine(const QStringList &args) {

	CommandLine commandLine;
	bool opts = true;
	QStringList operands;

	for (int i = 1; i < args.size(); i++) {

		if (opts && args[i] == QStringLiteral("--")) {
			opts = false; // treat all remaining arguments as operands
			continue;
		}

		if (opts && args[i] == QStringLiteral("-backtrack")) {
			commandLine.strategy = RegVM::Strategy::Backtracking;
		} else if (opts && args[i] == QStringLiteral("-parallel")) {
			commandLine.strategy = RegVM::Strategy::Parallel;
		} else if (opts && args[i] == QStringLiteral("-prefix")) {
			commandLine.anchoring = RegVM::Anchoring::Prefix;
		} else if (opts && args[i] == QStringLiteral("-full")) {
			commandLine.anchoring = RegVM::Anchoring::Full;
		} else if (opts && args[i] == QStringLiteral("-steps")) {
			i = GetArgumentParameter(args, i);

			bool ok;
			const qlonglong n = args[i].toLongLong(&ok);
			if (!ok) {
				fprintf(stderr, "regvm: -steps requires a numeric argument\n");
				return {};
			}

			try {
				commandLine.stepLimit = gsl::narrow<size_t>(n);
			} catch (const gsl::narrowing_error &) {
				fprintf(stderr, "regvm: -steps requires a non-negative argument\n");
				return {};
			}
		} else if (opts && args[i] == QStringLiteral("-config")) {
			i = GetArgumentParameter(args, i);

			commandLine.configFile = args[i];
		} else if (opts && args[i] == QStringLiteral("-e")) {
			i = GetArgumentParameter(args, i);

			commandLine.patterns.push_back(args[i].toLocal8Bit().toStdString());
		} else if (opts && args[i] == QStringLiteral("-describe")) {
			commandLine.describe = true;
		} else if (opts && args[i] == QStringLiteral("-count")) {
			commandLine.count = true;
		} else if (opts && args[i] == QStringLiteral("-invert")) {
			commandLine.invert = true;
		} else if (opts && (args[i] == QStringLiteral("-version") || args[i] == QStringLiteral("-V"))) {
			PrintVersion();
			exit(ExitMatched);
		} else if (opts && (args[i] == QStringLiteral("-h") || args[i] == QStringLiteral("-help"))) {
			fprintf(stderr, "%s", UsageMessage);
			exit(ExitMatched);
		} else if (opts && args[i].size() > 1 && args[i].startsWith(QLatin1Char('-'))) {
			fprintf(stderr, "regvm: Unrecognized option %s\n%s", qPrintable(args[i]), UsageMessage);
			return {};
		} else {
			operands.append(args[i]);
		}
	}

	// without -e the first operand is the pattern
	if (commandLine.patterns.empty()) {
		if (operands.isEmpty()) {
			fprintf(stderr, "regvm: no pattern given\n%s", UsageMessage);
			return {};
		}

		commandLine.patterns.push_back(operands.takeFirst().toLocal8Bit().toStdString());
	}

	commandLine.files = operands;
	return commandLine;
}

/**
 * @brief Selects the lines of `input` which match (or, with -invert, do
 * not match) any of the programs.
 *
 * @param input The stream to read lines from.
 * @param programs The compiled patterns.
 * @param options How to evaluate the programs.
 * @param commandLine The parsed command line.
 * @return The number of selected lines.
 */
size_t SelectLines(std::istream &input, const std::vector<std::shared_ptr<const RegVM::Program>> &programs, const RegVM::EvalOptions &options, const CommandLine &commandLine) {

	size_t selected = 0;
	std::string line;

	while (std::getline(input, line)) {
		bool matched = false;
		for (const std::shared_ptr<const RegVM::Program> &program : programs) {
			if (RegVM::evaluate(*program, line, options)) {
				matched = true;
				break;
			}
		}

		if (matched == commandLine.invert) {
			continue;
		}

		++selected;
		if (!commandLine.count) {
			std::cout << line << '\n';
		}
	}

	return selected;
}

}

/**
 * @brief Entry point of the regvm tool.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments.
 * @return 0 if a line was selected, 1 if none was, 2 on error.
 */
int main(int argc, char *argv[]) {

	QCoreApplication app(argc, argv);

	const std::optional<CommandLine> commandLine = ParseCommandLine(QCoreApplication::arguments());
	if (!commandLine) {
		return ExitTrouble;
	}

	if (commandLine->configFile.isEmpty()) {
		Settings::Load();
	} else {
		Settings::Load(commandLine->configFile);
	}

	RegVM::EvalOptions options = Settings::CurrentEvalOptions();
	options.strategy           = commandLine->strategy.value_or(options.strategy);
	options.anchoring          = commandLine->anchoring.value_or(options.anchoring);
	options.stepLimit          = commandLine->stepLimit.value_or(options.stepLimit);

	try {
		if (commandLine->describe) {
			for (const std::string &pattern : commandLine->patterns) {
				RegVM::describe(pattern, std::cout);
			}
			return ExitMatched;
		}

		RegVM::ProgramCache cache(gsl::narrow_cast<size_t>(Settings::cacheSize));

		std::vector<std::shared_ptr<const RegVM::Program>> programs;
		for (const std::string &pattern : commandLine->patterns) {
			programs.push_back(cache.get(pattern));
		}

		size_t selected = 0;
		bool trouble    = false;

		if (commandLine->files.isEmpty()) {
			selected += SelectLines(std::cin, programs, options, *commandLine);
		}

		for (const QString &filename : commandLine->files) {
			if (filename == QLatin1String("-")) {
				selected += SelectLines(std::cin, programs, options, *commandLine);
				continue;
			}

			std::ifstream file(filename.toLocal8Bit().toStdString());
			if (!file) {
				fprintf(stderr, "regvm: %s: could not open file\n", qPrintable(filename));
				trouble = true;
				continue;
			}

			selected += SelectLines(file, programs, options, *commandLine);
		}

		if (commandLine->count) {
			std::cout << selected << '\n';
		}

		if (trouble) {
			return ExitTrouble;
		}

		return selected != 0 ? ExitMatched : ExitNoMatch;
	} catch (const RegVM::RegexError &e) {
		fprintf(stderr, "regvm: %s\n", e.what());
		return ExitTrouble;
	}
}
