// This project is licensed under the Boost Software License.
// See license.txt for details.

#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>

#include <boost/program_options.hpp>

#include "compiler_error.hpp"
#include "file.hpp"
#include "graphviz.hpp"
#include "lexer_gen.hpp"
#include "options.hpp"

#define VERSION "0.4"

namespace po = boost::program_options;
namespace fs = std::filesystem;

void handle_options(fs::path dir, po::options_description const& cfg_desc, po::variables_map const& vm, int depth = 0)
{
    if(depth > 16)
        throw std::runtime_error("Configuration files nested too deeply.");

    // Config files are handled first, so that the command line overrides them.
    if(vm.count("config"))
    {
        for(std::string const& name : vm["config"].as<std::vector<std::string>>())
        {
            fs::path const full_path = dir / fs::path(name);
            std::ifstream ifs(full_path.string(), std::ios::in);
            if(!ifs)
                throw std::runtime_error(fmt("Unable to open configuration file: %", name));

            fs::path cfg_dir = full_path;
            cfg_dir.remove_filename();

            po::variables_map cfg_vm;
            po::store(po::parse_config_file(ifs, cfg_desc), cfg_vm);
            po::notify(cfg_vm);

            handle_options(cfg_dir, cfg_desc, cfg_vm, depth + 1);
        }
    }

    if(vm.count("input"))
    {
        std::string const name = vm["input"].as<std::string>();
        _options.input_file = name == "-" ? name : (dir / fs::path(name)).string();
    }

    if(vm.count("output"))
    {
        std::string const name = vm["output"].as<std::string>();
        _options.output_file = name == "-" ? name : (dir / fs::path(name)).string();
    }

    if(vm.count("simulate"))
        _options.simulate_file = (dir / fs::path(vm["simulate"].as<std::string>())).string();

    if(vm.count("graphviz"))
        _options.graphviz = true;

    if(vm.count("no-lines"))
        _options.line_directives = false;

    if(vm.count("no-minimize"))
        _options.minimize = false;

    if(vm.count("build-time"))
        _options.build_time = true;

    if(vm.count("stats"))
        _options.stats = true;

    if(vm.count("error-on-warning"))
        _options.werror = true;
}

int main(int argc, char** argv)
{
    try
    {
        /////////////////////////////
        // Handle program options: //
        /////////////////////////////
        {
            po::options_description cmdline("Instructional Flags");
            cmdline.add_options()
                ("help,h", "produce help message")
                ("version,v", "version")
            ;

            po::options_description basic("Options");
            basic.add_options()
                ("output,o", po::value<std::string>(), "output file (default lex.yy.c, '-' for stdout)")
                ("config,c", po::value<std::vector<std::string>>(), "read options from a configuration file")
                ("no-lines,L", "don't emit #line directives")
                ("error-on-warning,W", "turn warnings into errors")
                ("simulate", po::value<std::string>(), "print the tokens of a file instead of generating code")
            ;

            po::options_description debug("Debugging options");
            debug.add_options()
                ("graphviz,g", "output a graphviz file of the DFA")
                ("no-minimize", "skip DFA minimization")
                ("build-time,B", "print generator execution time")
                ("stats,s", "print automaton sizes")
            ;

            po::options_description basic_hidden("Hidden options");
            basic_hidden.add_options()
                ("input,i", po::value<std::string>(), "input file")
            ;

            po::options_description cmdline_full;
            cmdline_full.add(cmdline).add(basic).add(debug).add(basic_hidden);

            po::options_description config_full;
            config_full.add(basic).add(debug).add(basic_hidden);

            po::positional_options_description p;
            p.add("input", 1);

            po::variables_map vm;
            po::store(po::command_line_parser(argc, argv).options(cmdline_full).positional(p).run(), vm);
            po::notify(vm);

            if(vm.count("help"))
            {
                po::options_description visible;
                visible.add(cmdline).add(basic).add(debug);
                std::cout << "Usage: lexfab [options] [input]\n" << visible << std::endl;
                return EXIT_SUCCESS;
            }

            if(vm.count("version"))
            {
                std::cout << "lexfab " << VERSION << " (" << __DATE__ << ")\n";
                std::cout <<
                    "This is free software. "
                    "There is no warranty.\n";
                return EXIT_SUCCESS;
            }

            handle_options(fs::path(), config_full, vm);
        }

        ////////////////////////////////////
        // OK! Now to do the actual work: //
        ////////////////////////////////////

        auto time = std::chrono::system_clock::now();

        auto const output_time = [&time](char const* desc)
        {
            if(compiler_options().build_time)
            {
                auto now = std::chrono::system_clock::now();
                unsigned long long const ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - time).count();
                std::printf("time %-10s %8llu ms\n", desc, ms);
                time = std::chrono::system_clock::now();
            }
        };

        file_contents_t const file(compiler_options().input_file);
        output_time("read");

        lexer_t const lexer = compile_lexer(file, output_time);

        if(compiler_options().stats)
            print_stats(lexer, std::cout);

        if(!compiler_options().simulate_file.empty())
        {
            file_contents_t const input(compiler_options().simulate_file);
            return simulate_lexer(lexer, input, std::cout) ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        std::string const& output = compiler_options().output_file;
        write_file_atomic(output, gen_lexer_source(lexer, file, output));
        output_time("code gen");

        if(compiler_options().graphviz)
        {
            std::ostringstream ss;
            graphviz_dfa(ss, lexer.dfa, lexer.syntax);
            write_file_atomic(output == "-" ? std::string("lex.dot") : output + ".dot", ss.str());
            output_time("graphviz");
        }
    }
    catch(std::exception& e)
    {
        std::fflush(stdout);
        std::fprintf(stderr, "%s\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
