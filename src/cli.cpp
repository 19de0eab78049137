/**
 * @file cli.cpp
 * @brief sudokulogic command line interface.
 *
 * Solves puzzles, shows hints and deduction traces, and grades puzzle
 * files in bulk with the human-style technique solver.
 */

#include <sudokulogic/sudokulogic.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace sudokulogic;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_INCONSISTENT = 2;

struct Options {
    std::string command;
    std::string input;
    std::string techniques;
    std::size_t max_steps = 0; // 0 = unlimited
    bool quiet = false;
    bool help = false;
};

} // namespace

static void print_version() {
    std::printf("sudokulogic %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("sudokulogic %s - human-style Sudoku deduction engine\n", version());
    std::printf("=================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s solve <puzzle> [options]\n", prog_name);
    std::printf("  %s hint  <puzzle> [options]\n", prog_name);
    std::printf("  %s steps <puzzle> [options]\n", prog_name);
    std::printf("  %s batch <file>   [options]\n\n", prog_name);
    std::printf("Commands:\n");
    std::printf("  solve          Solve with logic only, print the grid and statistics\n");
    std::printf("  hint           Print the next deduction without applying it\n");
    std::printf("  steps          Print every solver step and its changes until solved or stuck\n");
    std::printf("  batch          Solve one puzzle per line of <file>\n\n");
    std::printf("Options:\n");
    std::printf("  -t, --techniques a,b,c  Ordered technique list (default: all)\n");
    std::printf("  -n, --max-steps N       Stop after N solver steps\n");
    std::printf("  -q, --quiet             Only print results\n");
    std::printf("  -h, --help              Show this help message\n");
    std::printf("  -v, --version           Show version information\n\n");
    std::printf("Puzzle format:\n");
    std::printf("  81 cells, 1-9 for givens and . _ or 0 for empty cells; whitespace is\n");
    std::printf("  ignored. <puzzle> may also name a file holding one puzzle.\n\n");
    std::printf("Techniques:\n");
    for (const BoxedTechnique& technique : all_techniques()) {
        std::printf("  %-20s %s\n", technique->name(), tier_name(technique->tier()));
    }
    std::printf("\nExit status:\n");
    std::printf("  0 success, 1 usage or input error, 2 puzzle cannot be completed\n\n");
    std::printf("Examples:\n");
    std::printf("  %s solve 53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79\n",
                prog_name);
    std::printf("  %s hint puzzle.txt -t \"naked single,hidden single\"\n\n", prog_name);
}

static bool read_file(const std::string& path, std::string& contents) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    contents = buffer.str();
    return true;
}

static bool load_puzzle(const std::string& input, DigitGrid& puzzle) {
    if (DigitGrid::parse(input, puzzle) == Error::Ok) {
        return true;
    }
    std::string contents;
    if (read_file(input, contents) && DigitGrid::parse(contents, puzzle) == Error::Ok) {
        return true;
    }
    std::fprintf(stderr, "Error: Not a valid puzzle or puzzle file: %s\n", input.c_str());
    return false;
}

static bool build_solver(const std::string& names, std::vector<BoxedTechnique>& techniques) {
    if (names.empty()) {
        techniques = all_techniques();
        return true;
    }

    std::size_t start = 0;
    while (start <= names.size()) {
        std::size_t end = names.find(',', start);
        if (end == std::string::npos) {
            end = names.size();
        }
        std::string name = names.substr(start, end - start);
        std::size_t first = name.find_first_not_of(' ');
        std::size_t last = name.find_last_not_of(' ');
        name = (first == std::string::npos) ? std::string() : name.substr(first, last - first + 1);
        BoxedTechnique technique = technique_by_name(name);
        if (!technique) {
            std::fprintf(stderr, "Error: Unknown technique: %s\n", name.c_str());
            return false;
        }
        techniques.push_back(std::move(technique));
        start = end + 1;
    }
    return true;
}

static void print_stats(const TechniqueSolver& solver, const TechniqueSolverStats& stats) {
    std::printf("Steps:       %zu\n", stats.total_steps());
    auto hardest = stats.max_tier(solver);
    std::printf("Hardest:     %s\n", hardest ? tier_name(*hardest) : "-");
    for (std::size_t i = 0; i < solver.techniques().size(); ++i) {
        if (stats.applications()[i] > 0) {
            std::printf("  %-30s %zu\n", solver.techniques()[i]->name(), stats.applications()[i]);
        }
    }
}

static void print_step(std::size_t index, const TechniqueStep& step) {
    std::printf("%4zu. %s\n", index, step.describe().c_str());
}

// Steps until solved, stuck or the step limit. Returns the solver's error.
// With trace, each printed line is one solver step with all of its changes.
static Error run_solver(const TechniqueSolver& solver, TechniqueGrid& grid,
                        TechniqueSolverStats& stats, bool& solved, std::size_t max_steps,
                        bool trace) {
    solved = false;
    Error result = grid.is_solved(solved);
    while (result == Error::Ok && !solved) {
        if (max_steps != 0 && stats.total_steps() >= max_steps) {
            break;
        }
        bool progressed = false;
        if (trace) {
            std::optional<TechniqueStep> applied;
            result = solver.step_explained(grid, stats, applied);
            progressed = applied.has_value();
            if (applied) {
                print_step(stats.total_steps(), *applied);
            }
        } else {
            result = solver.step(grid, stats, progressed);
        }
        if (result != Error::Ok || !progressed) {
            break;
        }
        result = grid.is_solved(solved);
    }
    return result;
}

static int do_solve(const Options& options, bool trace) {
    DigitGrid puzzle;
    if (!load_puzzle(options.input, puzzle)) {
        return EXIT_USAGE;
    }
    std::vector<BoxedTechnique> techniques;
    if (!build_solver(options.techniques, techniques)) {
        return EXIT_USAGE;
    }
    TechniqueSolver solver(std::move(techniques));

    TechniqueGrid grid = TechniqueGrid::from_digit_grid(puzzle);
    TechniqueSolverStats stats = solver.new_stats();
    bool solved = false;
    Error result = run_solver(solver, grid, stats, solved, options.max_steps, trace && !options.quiet);
    if (result == Error::Inconsistent) {
        std::fprintf(stderr, "Error: This board cannot be completed (%s)\n", error_string(result));
        return EXIT_INCONSISTENT;
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Solver failed with code %d\n", static_cast<int>(result));
        return EXIT_USAGE;
    }

    if (options.quiet) {
        std::printf("%s\n", grid.to_digit_grid().to_line().c_str());
        return EXIT_OK;
    }

    std::printf("Puzzle:      %s\n", puzzle.to_line().c_str());
    std::printf("Result:      %s\n", grid.to_digit_grid().to_line().c_str());
    std::printf("Solved:      %s\n", solved ? "yes" : "no");
    print_stats(solver, stats);
    std::printf("\n%s", grid.to_digit_grid().to_pretty_string().c_str());
    return EXIT_OK;
}

static int do_hint(const Options& options) {
    DigitGrid puzzle;
    if (!load_puzzle(options.input, puzzle)) {
        return EXIT_USAGE;
    }
    std::vector<BoxedTechnique> techniques;
    if (!build_solver(options.techniques, techniques)) {
        return EXIT_USAGE;
    }
    TechniqueSolver solver(std::move(techniques));

    TechniqueGrid grid = TechniqueGrid::from_digit_grid(puzzle);
    std::optional<TechniqueStep> step;
    Error result = solver.find_step(grid, step);
    if (result == Error::Inconsistent) {
        std::fprintf(stderr, "Error: This board cannot be completed (%s)\n", error_string(result));
        return EXIT_INCONSISTENT;
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Solver failed with code %d\n", static_cast<int>(result));
        return EXIT_USAGE;
    }

    if (!step) {
        std::printf("No deduction available with the selected techniques\n");
        return EXIT_OK;
    }
    if (options.quiet) {
        std::printf("%s\n", step->technique_name().c_str());
        return EXIT_OK;
    }

    std::printf("Technique:   %s\n", step->technique_name().c_str());
    std::printf("Cells:       %s\n", format_positions(step->condition_cells()).c_str());
    for (const auto& [cells, digits] : step->condition_digit_cells()) {
        std::printf("Because:     %s in %s\n", format_digits(digits).c_str(),
                    format_positions(cells).c_str());
    }
    for (const TechniqueApplication& app : step->application()) {
        if (app.is_placement()) {
            std::printf("Place:       %d at %s\n", digit_value(app.digit),
                        format_positions(DigitPositions::from_elem(app.position)).c_str());
        } else {
            std::printf("Eliminate:   %s from %s\n", format_digits(app.digits).c_str(),
                        format_positions(app.positions).c_str());
        }
    }
    return EXIT_OK;
}

static int do_batch(const Options& options) {
    std::string contents;
    if (!read_file(options.input, contents)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", options.input.c_str());
        return EXIT_USAGE;
    }
    std::vector<BoxedTechnique> techniques;
    if (!build_solver(options.techniques, techniques)) {
        return EXIT_USAGE;
    }
    TechniqueSolver solver(std::move(techniques));

    std::size_t total = 0;
    std::size_t solved_count = 0;
    std::size_t stuck_count = 0;
    std::size_t inconsistent_count = 0;
    std::size_t invalid_count = 0;
    std::size_t total_steps = 0;

    std::istringstream lines(contents);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(lines, line)) {
        ++line_number;
        std::size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        ++total;

        DigitGrid puzzle;
        if (DigitGrid::parse(line, puzzle) != Error::Ok) {
            std::fprintf(stderr, "Error: Line %zu is not a valid puzzle\n", line_number);
            ++invalid_count;
            continue;
        }

        TechniqueGrid grid = TechniqueGrid::from_digit_grid(puzzle);
        TechniqueSolverStats stats = solver.new_stats();
        bool solved = false;
        Error result = run_solver(solver, grid, stats, solved, options.max_steps, false);
        total_steps += stats.total_steps();

        const char* status = "stuck";
        if (result == Error::Inconsistent) {
            status = "inconsistent";
            ++inconsistent_count;
        } else if (result != Error::Ok) {
            status = error_string(result);
            ++invalid_count;
        } else if (solved) {
            status = "solved";
            ++solved_count;
        } else {
            ++stuck_count;
        }

        if (!options.quiet) {
            auto hardest = stats.max_tier(solver);
            std::printf("%5zu  %-12s %4zu steps  %-18s %s\n", line_number, status,
                        stats.total_steps(), hardest ? tier_name(*hardest) : "-",
                        grid.to_digit_grid().to_line().c_str());
        }
    }

    std::printf("Puzzles:      %zu\n", total);
    std::printf("Solved:       %zu\n", solved_count);
    std::printf("Stuck:        %zu\n", stuck_count);
    std::printf("Inconsistent: %zu\n", inconsistent_count);
    std::printf("Invalid:      %zu\n", invalid_count);
    std::printf("Total steps:  %zu\n", total_steps);
    return invalid_count == 0 ? EXIT_OK : EXIT_USAGE;
}

static bool parse_options(int argc, char** argv, Options& options) {
    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            options.quiet = true;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            options.help = true;
            return true;
        } else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--techniques") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: %s requires a value\n", arg);
                return false;
            }
            options.techniques = argv[++i];
        } else if (std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--max-steps") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: %s requires a value\n", arg);
                return false;
            }
            char* end = nullptr;
            long value = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || value < 0) {
                std::fprintf(stderr, "Error: max-steps must be a non-negative integer\n");
                return false;
            }
            options.max_steps = static_cast<std::size_t>(value);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            return false;
        } else if (options.input.empty()) {
            options.input = arg;
        } else {
            std::fprintf(stderr, "Error: Unexpected argument: %s\n", arg);
            return false;
        }
    }
    if (options.input.empty()) {
        std::fprintf(stderr, "Error: %s requires an input\n", options.command.c_str());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? EXIT_USAGE : EXIT_OK;
    }

    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return EXIT_OK;
    }

    Options options;
    options.command = argv[1];
    if (options.command != "solve" && options.command != "hint" && options.command != "steps" &&
        options.command != "batch") {
        std::fprintf(stderr, "Error: Unknown command: %s\n", argv[1]);
        std::fprintf(stderr, "Usage: %s <solve|hint|steps|batch> <input> [options]\n", argv[0]);
        return EXIT_USAGE;
    }
    if (!parse_options(argc, argv, options)) {
        return EXIT_USAGE;
    }
    if (options.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }

    if (options.command == "hint") {
        return do_hint(options);
    }
    if (options.command == "batch") {
        return do_batch(options);
    }
    return do_solve(options, options.command == "steps");
}
