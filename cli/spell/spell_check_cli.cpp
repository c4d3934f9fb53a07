// cli/spell/spell_check_cli.cpp
//
// Spell checker CLI backed by a radix tree dictionary.
//
// Usage:
//   ./spell_check document.txt
//   ./spell_check document.txt my_words.txt
//   cat document.txt | ./spell_check --stdin --dict my_words.txt
//
// Exit codes:
//   0  no misspelled words
//   1  at least one misspelled word (or an unexpected error)
//   2  bad arguments or a file that cannot be opened
//

#include <iostream>
#include <string>
#include <vector>

#include "spell/spell_checker.hpp"

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " <document> [dictionary]\n"
        << "  " << argv0 << " --stdin [--dict <dictionary>]\n"
        << "Options:\n"
        << "  --dict <path>  dictionary file, one word per line (default: "
        << SpellChecker::kStandardDictionaryPath << ")\n"
        << "  --stdin        read the document from standard input\n"
        << "  --verbose      print dictionary statistics to stderr\n";
}

int main(int argc, char **argv)
{
    try
    {
        std::string doc_path;
        std::string dict_path;
        bool stdin_mode = false;
        bool verbose = false;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--dict" && i + 1 < argc)
            {
                dict_path = argv[++i];
                continue;
            }
            if (a == "--stdin")
            {
                stdin_mode = true;
                continue;
            }
            if (a == "--verbose")
            {
                verbose = true;
                continue;
            }
            if (!a.empty() && a[0] == '-')
            {
                std::cerr << "Unknown/incomplete arg: " << a << "\n";
                usage(argv[0]);
                return 2;
            }
            positional.push_back(a);
        }

        if (!stdin_mode && !positional.empty())
        {
            doc_path = positional.front();
            positional.erase(positional.begin());
        }
        if (!positional.empty() && dict_path.empty())
        {
            dict_path = positional.front();
            positional.erase(positional.begin());
        }
        if ((!stdin_mode && doc_path.empty()) || !positional.empty())
        {
            usage(argv[0]);
            return 2;
        }

        const SpellChecker checker = dict_path.empty()
                                         ? SpellChecker::standard()
                                         : SpellChecker::fromFile(dict_path);
        if (verbose)
        {
            const RadixTree &dict = checker.getDictionary();
            std::cerr << "[dict] " << (dict_path.empty() ? SpellChecker::kStandardDictionaryPath : dict_path)
                      << " words=" << dict.getWordCount()
                      << " nodes=" << dict.getNodeSize() << "\n";
        }

        const std::vector<std::string> text = stdin_mode ? readLines(std::cin)
                                                         : readLinesFromFile(doc_path);

        const auto reports = checker.check(text);
        printReport(std::cout, reports);
        return reports.empty() ? 0 : 1;
    }
    catch (const FileNotFoundError &e)
    {
        std::cerr << "Error: The specified file could not be found: " << e.path() << "\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
