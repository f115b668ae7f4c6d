// Copyright 2020 Matthew Chandler

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include <cstring>
#include <iostream>
#include <iomanip>

#include <spdlog/spdlog.h>

#include "csvstream/csv.hpp"

struct Args
{
    const char * filename = "-";
    char32_t separator = U',';
    char32_t escape = U'"';
    bool use_headers = false;
    bool strict = false;
};

bool parse_args(Args * args, int argc, char * argv[])
{
    bool have_filename = false;
    for(int i = 1; i < argc; ++i)
    {
        if(std::strcmp(argv[i], "-s") == 0 && i + 1 < argc && std::strlen(argv[i + 1]) == 1)
            args->separator = static_cast<unsigned char>(argv[++i][0]);
        else if(std::strcmp(argv[i], "-q") == 0 && i + 1 < argc && std::strlen(argv[i + 1]) == 1)
            args->escape = static_cast<unsigned char>(argv[++i][0]);
        else if(std::strcmp(argv[i], "-m") == 0)
            args->use_headers = true;
        else if(std::strcmp(argv[i], "--strict") == 0)
            args->strict = true;
        else if(!have_filename)
        {
            args->filename = argv[i];
            have_filename = true;
        }
        else
        {
            std::cerr << "usage: " << argv[0] << " [-s separator] [-q escape] [-m] [--strict] [file | -]\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char * argv[])
{
    Args args;
    if(!parse_args(&args, argc, argv))
        return EXIT_FAILURE;

    csvstream::Decode_options options;
    options.separator = args.separator;
    options.escape_character = args.escape;
    if(args.use_headers)
    {
        options.headers = csvstream::Headers::first_row();
        options.validate_row_length = true;
    }

    try
    {
        auto input{ std::string{args.filename} == "-" ? csvstream::Reader{ std::cin,      options, args.strict }
                                                      : csvstream::Reader{ args.filename, options, args.strict }};

        std::vector<std::vector<std::string>> data;
        std::vector<std::size_t> col_size(4);

        auto add_row = [&data, &col_size](csvstream::Row row)
        {
            data.emplace_back();
            std::size_t i = 0;
            for(auto & field: row)
            {
                if(i == std::size(col_size))
                    col_size.resize(std::size(col_size) * 2);

                col_size[i] = std::max(col_size[i], std::size(field));

                data.back().emplace_back(std::move(field));
                ++i;
            }
        };

        for(auto & result: input)
        {
            if(!result)
            {
                spdlog::warn("skipping row: {}", result.error());
                continue;
            }

            if(std::empty(data) && args.use_headers)
                add_row(input.headers());
            add_row(std::move(result.value()));
        }

        for(auto & row: data)
        {
            for(std::size_t i = 0; i < std::size(row); ++i)
            {
                if(i != 0)
                    std::cout << " | ";

                std::cout << std::left << std::setw(col_size[i]) << row[i];
            }
            std::cout << '\n';
        }
    }
    catch(const csvstream::Parse_error & e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch(const csvstream::Option_error & e)
    {
        spdlog::error("invalid options: {}", e.what());
        return EXIT_FAILURE;
    }
    catch(const csvstream::IO_error & e)
    {
        spdlog::error("I/O error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
