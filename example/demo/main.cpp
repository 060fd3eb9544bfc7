// main.cpp - Document Session Example

#include <cfgtree/builders.h>
#include <cfgtree/document_session.h>
#include <cfgtree/path_utils.h>
#include <cfgtree/serialization.h>

#include <iostream>
#include <string>

using namespace cfgtree;

// ============================================================
// Sample documents
// ============================================================

namespace {

const char* const kOriginal = R"({
  "title": "Settings",
  "window": {
    "width": 800,
    "height": 600
  },
  "recent": [
    "a.txt",
    "b.txt"
  ]
}
)";

Value create_current()
{
    return ObjectBuilder()
        .set("title", "Settings")
        .set("window", ObjectBuilder().set("width", 1024).set("height", 600).set("maximized", true).finish())
        .set("recent", ArrayBuilder().push_back("a.txt").finish())
        .finish();
}

void print_rows(const DocumentSession& session)
{
    for (const auto& node : session.nodes()) {
        std::cout << std::string(node.depth * 2, ' ');
        std::cout << (node.is_container() ? (node.expanded ? "- " : "+ ") : "  ");
        std::cout << node.label << " : ";
        if (node.is_container()) {
            std::cout << node_type_label(node);
        } else {
            std::cout << value_to_string(node.value);
        }
        if (node.change) std::cout << "  [" << to_string(*node.change) << "]";
        if (node.is_current_match) std::cout << "  <match>";
        std::cout << "\n";
    }
    std::cout << "(" << session.changes().changed_field_count() << " changed)\n";
}

std::string read_line(const char* prompt)
{
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

} // namespace

int main()
{
    DocumentSession session;

    auto original = parse_json(kOriginal);
    session.configure(create_current(), original, DocumentStatus::Unchanged, SessionConfig{},
                      to_json(create_current()) + "\n");

    std::cout << "=== Document Session Example ===\n";
    std::cout << "Tree view over a JSON document with changes against its original\n\n";

    while (true) {
        print_rows(session);
        if (!session.last_error().empty()) {
            std::cout << "Last error: " << session.last_error() << "\n";
        }

        std::cout << "\n=== View ===\n";
        std::cout << "T. Toggle expansion\n";
        std::cout << "E. Expand all\n";
        std::cout << "C. Collapse all except root\n";
        std::cout << "F. Toggle changed-only filter\n";
        std::cout << "S. Reveal path\n";
        std::cout << "\n=== Edit ===\n";
        std::cout << "1. Set value (JSON literal)\n";
        std::cout << "2. Add field\n";
        std::cout << "3. Remove value\n";
        std::cout << "\n=== Document ===\n";
        std::cout << "V. Show value at path\n";
        std::cout << "P. Print text\n";
        std::cout << "W. Save\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice)) return 0;
        std::cin.ignore();

        switch (choice) {
        case 'T':
        case 't':
            session.toggle_expand(read_line("Path: "));
            break;
        case 'E':
        case 'e':
            session.expand_all();
            break;
        case 'C':
        case 'c':
            session.collapse_all_except_root();
            break;
        case 'F':
        case 'f':
            session.set_show_changed_only(!session.model().show_changed_only);
            break;
        case 'S':
        case 's':
            session.reveal(read_line("Path: "));
            break;
        case '1': {
            std::string path = read_line("Path: ");
            std::string error;
            auto value = parse_json(read_line("Value: "), &error);
            if (!value) {
                std::cout << "Invalid JSON: " << error << "\n";
                break;
            }
            session.set_value(path, *value);
            break;
        }
        case '2': {
            std::string object_path = read_line("Object path: ");
            std::string key = read_line("Key: ");
            std::string error;
            auto value = parse_json(read_line("Value: "), &error);
            if (!value) {
                std::cout << "Invalid JSON: " << error << "\n";
                break;
            }
            session.add_field(object_path, key, *value);
            break;
        }
        case '3':
            session.remove_value(read_line("Path: "));
            break;
        case 'V':
        case 'v': {
            std::string path = read_line("Path: ");
            if (auto value = get_at_path(session.current(), path)) {
                std::cout << to_json(*value) << "\n";
            } else {
                std::cout << "No value at '" << path << "'\n";
            }
            break;
        }
        case 'P':
        case 'p':
            std::cout << session.text() << "\n";
            break;
        case 'W':
        case 'w': {
            SavePayload payload = session.save();
            std::cout << (payload.sparse ? "Sparse payload:\n" : "Payload:\n") << payload.text << "\n";
            session.mark_saved(payload);
            break;
        }
        case 'Q':
        case 'q':
            std::cout << "Goodbye!\n";
            return 0;
        default:
            std::cout << "Invalid choice!\n";
        }

        std::cout << "\n";
    }
}
