/**
 * @file pagedtable-cli.cpp
 * @brief Interactive shell driving a TableController over sample contacts
 */

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "source/vector_row_source.h"
#include "table/table_controller.h"
#include "utils/task_queue.h"

// Try to use readline if available
#ifdef HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define USE_READLINE 1
#endif

namespace {

using pagedtable::source::VectorRowSource;
using pagedtable::table::TableColumn;
using pagedtable::table::TableController;

struct Contact {
  int id = 0;
  std::string name;
  std::string city;

  bool operator==(const Contact& other) const { return id == other.id && name == other.name && city == other.city; }
};

using ContactTable = TableController<std::string, Contact>;
using ContactSource = VectorRowSource<Contact>;

#ifdef USE_READLINE
// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays,cppcoreguidelines-avoid-non-const-global-variables)
const char* command_list[] = {"next",   "prev", "refresh", "sort",   "size", "select", "unselect", "toggle",
                              "all",    "none", "expand",  "remove", "insert", "fail", "show",     "debug",
                              "help",   "quit", "exit",    nullptr};

/**
 * @brief Command name generator for readline completion
 */
char* CommandGenerator(const char* text, int state) {
  static int list_index;
  static size_t len;
  const char* name = nullptr;

  if (state == 0) {
    list_index = 0;
    len = strlen(text);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
  while ((name = command_list[list_index++]) != nullptr) {
    if (strncmp(name, text, len) == 0) {
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      return strdup(name);
    }
  }

  return nullptr;
}

char** CommandCompletion(const char* text, int start, int /* end */) {
  rl_attempted_completion_over = 1;
  if (start != 0) {
    return nullptr;
  }
  return rl_completion_matches(text, CommandGenerator);
}
#endif

std::vector<std::string> ParseTokens(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream iss(line);
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::optional<int> ParseInt(const std::string& text) {
  int value = 0;
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief Deterministic sample rows
 */
std::vector<Contact> MakeSampleContacts(int count) {
  static const std::vector<std::string> kFirstNames = {"Ada",   "Grace", "Linus", "Barbara", "Ken",
                                                       "Dennis", "Bjarne", "Margaret", "Edsger", "Frances"};
  static const std::vector<std::string> kCities = {"Tokyo", "Berlin", "Lisbon", "Austin", "Oslo", "Nairobi", "Lima"};

  std::vector<Contact> contacts;
  contacts.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    Contact contact;
    contact.id = i + 1;
    const auto name_pos = static_cast<size_t>(i * 7) % kFirstNames.size();
    const auto city_pos = static_cast<size_t>(i * 3) % kCities.size();
    contact.name = kFirstNames[name_pos] + " #" + std::to_string(contact.id);
    contact.city = kCities[city_pos];
    contacts.push_back(std::move(contact));
  }
  return contacts;
}

std::map<std::string, ContactSource::Comparator> MakeComparators() {
  return {
      {"id", [](const Contact& lhs, const Contact& rhs) { return lhs.id < rhs.id; }},
      {"name", [](const Contact& lhs, const Contact& rhs) { return lhs.name < rhs.name; }},
      {"city", [](const Contact& lhs, const Contact& rhs) { return lhs.city < rhs.city; }},
  };
}

/**
 * @brief Interactive shell around one contact table
 */
class TableShell {
 public:
  TableShell(const pagedtable::config::TableConfig& table_config, int row_count)
      : table_config_(table_config), row_count_(row_count), next_id_(row_count + 1), table_(task_queue_) {}

  ~TableShell() {
    table_.Dispose();
    task_queue_.Shutdown();
  }

  TableShell(const TableShell&) = delete;
  TableShell& operator=(const TableShell&) = delete;
  TableShell(TableShell&&) = delete;
  TableShell& operator=(TableShell&&) = delete;

  pagedtable::utils::Expected<void, pagedtable::utils::Error> Start() {
    auto source = std::make_unique<ContactSource>(task_queue_, MakeSampleContacts(row_count_), MakeComparators());
    source_ = source.get();

    table_.AddListener([this]() {
      ++broadcasts_;
      WatchVisibleRows();
    });

    std::vector<TableColumn> columns = {
        {"id", "ID", true, true},
        {"name", "Name", true, false},
        {"city", "City", true, false},
    };
    auto init = table_.Init(std::move(columns), std::move(source), table_config_);
    if (!init) {
      return init;
    }
    task_queue_.RunUntilIdle();
    return {};
  }

  void RunInteractive() {
    std::cout << "pagedtable-cli: " << row_count_ << " sample contacts" << '\n';
    std::cout << "Type 'quit' or 'exit' to exit, 'help' for help" << '\n';
    std::cout << '\n';
    PrintTable();

#ifdef USE_READLINE
    rl_attempted_completion_function = CommandCompletion;
#endif

    while (true) {
      std::string line;
      const std::string prompt = "page " + std::to_string(table_.GetCurrentPageIndex()) + "> ";

#ifdef USE_READLINE
      char* input = readline(prompt.c_str());
      if (input == nullptr) {
        std::cout << '\n';
        break;
      }
      line = input;
      if (!line.empty()) {
        add_history(input);
      }
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      free(input);
#else
      std::cout << prompt;
      std::cout.flush();
      if (!std::getline(std::cin, line)) {
        break;  // EOF
      }
#endif

      line.erase(0, line.find_first_not_of(" \t\r\n"));
      line.erase(line.find_last_not_of(" \t\r\n") + 1);
      if (line.empty()) {
        continue;
      }
      if (line == "quit" || line == "exit") {
        std::cout << "Bye!" << '\n';
        break;
      }

      Execute(ParseTokens(line));
    }
  }

 private:
  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  void Execute(const std::vector<std::string>& tokens) {
    const std::string& command = tokens[0];
    row_updates_ = 0;
    broadcasts_ = 0;

    pagedtable::utils::Expected<void, pagedtable::utils::Error> result;
    bool print_table = true;

    if (command == "help") {
      PrintHelp();
      return;
    }
    if (command == "show") {
      PrintTable();
      return;
    }
    if (command == "debug") {
      std::cout << table_.DebugString() << '\n';
      table_.LogDebugState();
      return;
    }

    if (command == "next") {
      result = table_.NextPage();
    } else if (command == "prev") {
      result = table_.PreviousPage();
    } else if (command == "refresh") {
      result = table_.Refresh(tokens.size() > 1 && tokens[1] == "start");
    } else if (command == "sort") {
      result = table_.SwipeSortModel(tokens.size() > 1 ? std::optional<std::string>(tokens[1]) : std::nullopt);
    } else if (command == "fail") {
      source_->FailNextFetches(1);
      result = table_.Refresh(false);
    } else if (command == "all") {
      result = table_.SelectAllRows();
    } else if (command == "none") {
      result = table_.UnselectEveryRow();
    } else if (command == "insert") {
      if (tokens.size() < 3) {
        std::cout << "(error) usage: insert <name> <city>" << '\n';
        return;
      }
      result = table_.Insert(Contact{next_id_++, tokens[1], tokens[2]});
    } else if (command == "size" || command == "select" || command == "unselect" || command == "toggle" ||
               command == "expand" || command == "remove") {
      std::optional<int> value = tokens.size() > 1 ? ParseInt(tokens[1]) : std::nullopt;
      if (!value.has_value()) {
        std::cout << "(error) usage: " << command << " <number>" << '\n';
        return;
      }
      if (command == "size") {
        result = table_.SetPageSize(*value);
      } else if (command == "select") {
        result = table_.SelectRow(*value);
      } else if (command == "unselect") {
        result = table_.UnselectRow(*value);
      } else if (command == "toggle") {
        result = table_.ToggleRow(*value);
      } else if (command == "expand") {
        result = table_.ToggleRowExpansion(*value);
      } else {
        result = table_.RemoveRowAt(*value);
      }
    } else {
      std::cout << "(error) Unknown command: " << command << " (type 'help')" << '\n';
      print_table = false;
    }

    if (!result) {
      std::cout << "(error) " << result.error().message() << '\n';
      return;
    }

    task_queue_.RunUntilIdle();
    if (print_table) {
      std::cout << "(" << row_updates_ << " row updates, " << broadcasts_ << " broadcasts)" << '\n';
      PrintTable();
    }
  }

  void WatchVisibleRows() {
    for (int index = 0; index < table_.TotalItems(); ++index) {
      if (watched_rows_.insert(index).second) {
        table_.AddRowChangeListener(index, [this](int /* index */, const Contact* /* item */) { ++row_updates_; });
      }
    }
  }

  void PrintTable() const {
    std::cout << "Page " << table_.GetCurrentPageIndex() << " | size " << table_.GetPageSize() << " | rows "
              << table_.TotalItems() << " | state " << pagedtable::table::TableStateToString(table_.GetState());
    const auto& sort = table_.GetSortModel();
    std::cout << " | sort " << (sort.has_value() ? sort->ToString() : "none");
    std::cout << (table_.HasPreviousPage() ? " | <prev" : "") << (table_.HasNextPage() ? " | next>" : "") << '\n';

    const auto& error = table_.GetCurrentError();
    if (table_.GetState() == pagedtable::table::TableState::kError && error.has_value()) {
      std::cout << "(error) " << error->message() << " - try 'refresh'" << '\n';
      return;
    }

    std::cout << "      " << std::left << std::setw(5) << "ID" << std::setw(20) << "Name"
              << "City" << '\n';
    const auto& items = table_.GetItems();
    for (size_t i = 0; i < items.size(); ++i) {
      const int index = static_cast<int>(i);
      const Contact& contact = items[i];
      std::cout << std::right << std::setw(3) << index << (table_.IsRowSelected(index) ? " * " : "   ") << std::left
                << std::setw(5) << contact.id << std::setw(20) << contact.name << contact.city << '\n';
      if (table_.IsRowExpanded(index)) {
        std::cout << "        id=" << contact.id << " name=\"" << contact.name << "\" city=\"" << contact.city << "\""
                  << '\n';
      }
    }
    std::cout << std::right;
  }

  static void PrintHelp() {
    std::cout << "Available commands:" << '\n';
    std::cout << "  next | prev                 Go to the next / previous page" << '\n';
    std::cout << "  refresh [start]             Refetch the current page (or restart from page 0)" << '\n';
    std::cout << "  sort [column]               Cycle the sort of id, name or city" << '\n';
    std::cout << "  size <n>                    Set the page size" << '\n';
    std::cout << "  select|unselect|toggle <i>  Change the selection of row i" << '\n';
    std::cout << "  all | none                  Select every row / clear the selection" << '\n';
    std::cout << "  expand <i>                  Toggle the detail line of row i" << '\n';
    std::cout << "  remove <i>                  Remove row i from the page" << '\n';
    std::cout << "  insert <name> <city>        Append a row to the page" << '\n';
    std::cout << "  fail                        Make the next fetch fail and refresh" << '\n';
    std::cout << "  show | debug                Print the page / the pagination state" << '\n';
    std::cout << "  quit/exit                   Exit" << '\n';
  }

  pagedtable::config::TableConfig table_config_;
  int row_count_;
  int next_id_;
  pagedtable::utils::TaskQueue task_queue_;
  ContactTable table_;
  ContactSource* source_ = nullptr;
  std::set<int> watched_rows_;
  int row_updates_ = 0;
  int broadcasts_ = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
  auto args_result = pagedtable::app::CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    std::cerr << "Error: " << args_result.error().message() << '\n';
    pagedtable::app::CommandLineParser::PrintHelp(argv[0]);
    return 1;
  }
  const auto& args = *args_result;

  if (args.show_help) {
    pagedtable::app::CommandLineParser::PrintHelp(argv[0]);
    return 0;
  }
  if (args.show_version) {
    pagedtable::app::CommandLineParser::PrintVersion();
    return 0;
  }

  auto config_manager = pagedtable::app::ConfigurationManager::Create(args.config_file);
  if (!config_manager) {
    std::cerr << "Error: " << config_manager.error().to_string() << '\n';
    return 1;
  }

  if (args.config_test_mode) {
    return (*config_manager)->PrintConfigTest();
  }

  if (auto logging = (*config_manager)->ApplyLoggingConfig(); !logging) {
    std::cerr << "Error: " << logging.error().to_string() << '\n';
    return 1;
  }

  TableShell shell((*config_manager)->GetConfig().table, args.row_count);
  if (auto started = shell.Start(); !started) {
    spdlog::error("Failed to start table: {}", started.error().to_string());
    return 1;
  }
  shell.RunInteractive();
  return 0;
}
