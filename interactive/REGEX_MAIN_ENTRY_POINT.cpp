/// REGEX_MAIN_ENTRY_POINT.cpp - Interactive pattern/text console
#include "REGEX.hpp"
#include <iostream>
#include <string>

using namespace std;
using namespace BtRegex;

int main() {
    cout << "=== Backtracking Regex Console ===\n";
    cout << "Supports literals, (groups), a|b and a*; matches the whole text\n";
    cout << "Type 'quit' or 'exit' to quit\n";
    string pattern, text;

    while (true) {
        cout << "\nPattern: ";
        if (!getline(cin, pattern)) break;

        if (pattern == "quit" || pattern == "exit") break;

        /* Compile */
        optional<Regex> regex;
        try {
            regex.emplace(Regex::from_str(pattern));
        } catch (const BtError::SyntaxError &e) {
            cerr << e.what() << "\n";
            continue;
        }
        cout << "Parsed: " << regex->debug() << " (" << regex->capture_count()
             << " groups)\n";

        cout << "Text to match: ";
        if (!getline(cin, text)) break;

        /* Match */
        optional<CaptureTable> result = regex->match_str(text);

        if (result) {
            cout << "Result: MATCH\n";
            cout << "Captures: " << format_captures(*result) << "\n";
        } else {
            cout << "Result: NO MATCH\n";
        }
    }

    cout << "\nGoodbye!\n";
    return 0;
}
