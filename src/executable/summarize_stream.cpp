#include <iostream>
#include <stdexcept>

using std::runtime_error;
using std::cerr;

#include "cpptrace/from_current.hpp"
#include "VarianceIncrementor.hpp"
#include "CLI/CLI.hpp"
#include "misc.hpp"

#include <filesystem>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <limits>
#include <string>

using std::filesystem::exists;
using std::filesystem::path;
using std::ifstream;
using std::ostream;
using std::string;
using std::cout;

using namespace MlMath;


template<class T> void print_row(ostream& o, const VarianceIncrementor<T>& stats){
    o << stats.count() << '\t' << stats.mean() << '\t' << stats.variance() << '\n';
}


template<class T> void summarize(istream& input, size_t every){
    VarianceIncrementor<T> stats;

    cout << std::setprecision(std::numeric_limits<T>::max_digits10);

    if (every > 0){
        cout << "count" << '\t' << "mean" << '\t' << "variance" << '\n';
    }

    for_each_value(input, [&](double x){
        stats.add(T(x));

        if (every > 0 and stats.count() % every == 0){
            print_row(cout, stats);
        }
    });

    if (stats.count() == 0){
        cerr << "WARNING: no values were read, reporting the initial state" << '\n';
    }

    cout << "count" << '\t' << stats.count() << '\n';
    cout << "mean" << '\t' << stats.mean() << '\n';
    cout << "variance" << '\t' << stats.variance() << '\n';
}


void summarize(const path& input_path, int precision, size_t every){
    if (input_path == "-"){
        cerr << "Reading from stdin" << '\n';

        if (precision == 32){
            summarize<float>(std::cin, every);
        }
        else {
            summarize<double>(std::cin, every);
        }

        return;
    }

    if (not exists(input_path)){
        throw runtime_error("ERROR: input file does not exist: " + input_path.string());
    }

    ifstream file(input_path);

    if (not file.good()){
        throw runtime_error("ERROR: could not open input file: " + input_path.string());
    }

    cerr << "Reading: " << input_path << '\n';

    if (precision == 32){
        summarize<float>(file, every);
    }
    else {
        summarize<double>(file, every);
    }
}


int main(int argc, char* argv[]){
    CLI::App app{"Running mean and variance of a stream of numbers, one pass, constant memory"};
    path input_path = "-";
    int precision = 64;
    size_t every = 0;

    app.add_option(
            "--input",
            input_path,
            "Text file with values separated by whitespace, commas or newlines. '#' starts a comment. '-' for stdin."
            );

    app.add_option(
            "--precision",
            precision,
            "Floating point width of the accumulator, in bits"
            )->check(CLI::IsMember({32, 64}));

    app.add_option(
            "--every",
            every,
            "Print count, mean and variance after every N values (0 = only at the end)"
            );

    try{
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    CPPTRACE_TRY {
        summarize(input_path, precision, every);
    } CPPTRACE_CATCH(const std::exception& e) {
        std::cerr<<"Exception: "<<e.what()<<std::endl;
        cpptrace::from_current_exception().print_with_snippets();
        return 1;
    }

    return 0;
}
