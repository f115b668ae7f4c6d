#ifndef CSV_TEST_SUITE_HPP
#define CSV_TEST_SUITE_HPP

#include <functional>
#include <iostream>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "csvstream/csv.hpp"

#include "test.hpp"

using CSV_data = std::vector<std::vector<std::string>>;
using Decoded_data = std::vector<csvstream::Row_result>;

inline csvstream::Row_result ok_row(csvstream::Row row)
{
    return csvstream::Row_result::ok(std::move(row));
}

inline csvstream::Row_result stray_error(std::size_t line, std::string sequence, bool stream_halted = false)
{
    csvstream::Error_info info;
    info.kind = csvstream::Error_kind::stray_escape_character;
    info.line = line;
    info.sequence = std::move(sequence);
    info.stream_halted = stream_halted;
    return csvstream::Row_result::error(std::move(info));
}

inline csvstream::Row_result escape_error(std::size_t line, std::string sequence, std::size_t escape_max_lines, bool stream_halted = false)
{
    csvstream::Error_info info;
    info.kind = csvstream::Error_kind::escape_sequence;
    info.line = line;
    info.sequence = std::move(sequence);
    info.escape_max_lines = escape_max_lines;
    info.stream_halted = stream_halted;
    return csvstream::Row_result::error(std::move(info));
}

class CSV_test_suite
{
public:
    class CSV_test_group
    {
    public:
        virtual ~CSV_test_group() = default;
        virtual void register_tests(CSV_test_suite & tests) const = 0;
        friend CSV_test_suite;
    };

    static test::Result common_read_return(const std::string & csv_text, const Decoded_data & expected_data, const Decoded_data & data)
    {
        return test::pass_fail(data == expected_data, [csv_text, expected_data, data]()
        {
            std::cout << "given:    "; print_escapes(csv_text);   std::cout << '\n';
            std::cout << "expected: "; print_data(expected_data); std::cout << '\n';
            std::cout << "got:      "; print_data(data);          std::cout << "\n\n";
        });
    }

    static test::Result common_write_return(const CSV_data & data, const std::string & expected_text, const std::string & csv_text)
    {
        return test::pass_fail(csv_text == expected_text, [data, expected_text, csv_text]()
        {
            std::cout << "given:    "; print_data(data);             std::cout << '\n';
            std::cout << "expected: "; print_escapes(expected_text); std::cout << '\n';
            std::cout << "got:      "; print_escapes(csv_text);      std::cout << "\n\n";
        });
    }

    static void print_escapes(const std::string & text, bool escape_quote = false)
    {
        for(auto & c: text)
        {
            switch(c)
            {
            case '\r':
                std::cout<<"\\r";
                break;
            case '\n':
                std::cout<<"\\n";
                break;
            case '"':
                if(escape_quote)
                {
                    std::cout<<"\\\"";
                    break;
                }
                [[fallthrough]];
            default:
                std::cout<<c;
                break;
            }
        }
    }

    static void print_row(const std::vector<std::string> & row)
    {
        std::cout<<'{';
        bool first_col = true;
        for(auto & col: row)
        {
            if(!first_col)
                std::cout<<", ";
            first_col = false;

            std::cout<<'"';
            print_escapes(col, true);
            std::cout<<'"';
        }
        std::cout<<'}';
    }

    static void print_data(const CSV_data & data)
    {
        bool first_row = true;
        std::cout<<'{';
        for(auto & row: data)
        {
            if(!first_row)
                std::cout<<", ";
            first_row = false;

            print_row(row);
        }
        std::cout<<'}';
    };

    static void print_data(const Decoded_data & data)
    {
        bool first_row = true;
        std::cout<<'{';
        for(auto & result: data)
        {
            if(!first_row)
                std::cout<<", ";
            first_row = false;

            if(result)
            {
                print_row(result.row());
                continue;
            }

            auto & info = result.error();
            std::cout<<'<'<<csvstream::to_string(info.kind)<<" line "<<info.line<<": \"";
            print_escapes(info.sequence, true);
            std::cout<<'"';
            if(info.kind == csvstream::Error_kind::escape_sequence)
                std::cout<<" max "<<info.escape_max_lines;
            if(info.stream_halted)
                std::cout<<" halted";
            std::cout<<'>';
        }
        std::cout<<'}';
    }

    using Read_test_fun = std::function<test::Result(const std::string&, const Decoded_data&, const csvstream::Decode_options&)>;
    using Write_test_fun = std::function<test::Result(const std::string&, const CSV_data&, const csvstream::Encode_options&)>;
    using Unit_test_fun = std::function<test::Result()>;

    void register_read_test(Read_test_fun test_fun)
    {
        read_tests_.emplace_back(test_fun);
    }

    void register_write_test(Write_test_fun test_fun)
    {
        write_tests_.emplace_back(test_fun);
    }

    void register_unit_test(const std::string & title, Unit_test_fun test_fun)
    {
        unit_tests_.emplace_back(title, test_fun);
    }

    void register_tests(const CSV_test_group & group)
    {
        group.register_tests(*this);
    }

    bool run_tests() const
    {
        test::Test<const std::string&, const Decoded_data&, const csvstream::Decode_options&> test_read(read_tests_);
        test::Test<const std::string&, const CSV_data&, const csvstream::Encode_options&> test_write(write_tests_);

        // create a bound function obj for test_read & test_write's pass & fail methods
        using namespace std::placeholders;
        auto test_read_pass  = std::bind(&decltype(test_read)::test_pass,  &test_read,  _1, _2, _3, _4);
        auto test_read_fail  = std::bind(&decltype(test_read)::test_fail,  &test_read,  _1, _2, _3, _4);
        auto test_write_pass = std::bind(&decltype(test_write)::test_pass, &test_write, _1, _2, _3, _4);

        if(!std::empty(test_read))
        {
            std::cout<<"Reader Tests:\n";

            test_quotes(test_read_pass, "Read test: empty file",
                    "", {});

            test_quotes(test_read_pass, "Read test: blank line",
                    "\r\n", {ok_row({""})});

            test_quotes(test_read_pass, "Read test: bare LF",
                    "\n", {ok_row({""})});

            test_quotes(test_read_pass, "Read test: 1 field",
                    "1\r\n", {ok_row({"1"})});

            test_quotes(test_read_pass, "Read test: 1 quoted field",
                    "\"1\"\r\n", {ok_row({"1"})});

            test_quotes(test_read_pass, "Read test: 1 empty quoted field",
                    "\"\"\r\n", {ok_row({""})});

            test_quotes(test_read_pass, "Read test: 1 row",
                    "1,2,3,4\r\n", {ok_row({"1", "2", "3", "4"})});

            test_quotes(test_read_pass, "Read test: leading space",
                    " 1, 2, 3, 4\r\n", {ok_row({" 1", " 2", " 3", " 4"})});

            test_quotes(test_read_pass, "Read test: trailing space",
                    "1 ,2 ,3 ,4 \r\n", {ok_row({"1 ", "2 ", "3 ", "4 "})});

            test_quotes(test_read_pass, "Read test: leading & trailing space",
                    " 1 , 2 , 3 , 4 \r\n", {ok_row({" 1 ", " 2 ", " 3 ", " 4 "})});

            test_quotes(test_read_pass, "Read test: 1 quoted row",
                    "\"1\",\"2\",\"3\",\"4\"\r\n", {ok_row({"1", "2", "3", "4"})});

            test_quotes(test_read_pass, "Read test: empty fields",
                    ",,,", {ok_row({"", "", "", ""})});

            test_quotes(test_read_pass, "Read test: empty fields then row",
                    ",\nc,d\n", {ok_row({"", ""}), ok_row({"c", "d"})});

            test_quotes(test_read_pass, "Read test: escaped quotes",
                    "\"\"\"1\"\"\",\"\"\"2\"\"\",\"\"\"3\"\"\",\"\"\"4\"\"\"\r\n",
                    {ok_row({"\"1\"", "\"2\"", "\"3\"", "\"4\""})});

            test_quotes(test_read_pass, "Read test: doubled quote inside field",
                    "\"a\"\"b\"\n", {ok_row({"a\"b"})});

            test_quotes(test_read_pass, "Read test: doubled quote after newline inside field",
                    "\"a\nb\"\"c\"\nd\n", {ok_row({"a\nb\"c"}), ok_row({"d"})});

            test_quotes(test_read_pass, "Read test: empty quoted fields",
                    "\"\",\"\",\"\",\"\"\r\n", {ok_row({"", "", "", ""})});

            test_quotes(test_read_pass, "Read test: commas & newlines",
                    "\"\n\",\"\r\",\"\r\n\",\",,\"\r\n", {ok_row({"\n", "\r", "\r\n", ",,"})});

            test_quotes(test_read_pass, "Read test: no CRLF at EOF",
                    "1,2,3,4", {ok_row({"1", "2", "3", "4"})});

            test_quotes(test_read_pass, "Read test: quoted field at EOF",
                    "1,\"2\"", {ok_row({"1", "2"})});

            test_quotes(test_read_pass, "Read test: last field empty",
                    "1,2,3,\r\n", {ok_row({"1", "2", "3", ""})});

            test_quotes(test_read_pass, "Read test: last field empty - no CRLF at EOF",
                    "1,2,3,", {ok_row({"1", "2", "3", ""})});

            test_quotes(test_read_pass, "Read test: 2 CRLFs at EOF",
                    "1,2,3\r\n\r\n", {ok_row({"1", "2", "3"}), ok_row({""})});

            test_quotes(test_read_pass, "Read test: multirow",
                    "1,2,3\r\n4,5,6\r\n", {ok_row({"1", "2", "3"}), ok_row({"4", "5", "6"})});

            test_quotes(test_read_pass, "Read test: CR w/o LF",
                    "1,2,3\r4,5,6\r", {ok_row({"1", "2", "3"}), ok_row({"4", "5", "6"})});

            test_quotes(test_read_pass, "Read test: LF w/o CR",
                    "1,2,3\n4,5,6\n", {ok_row({"1", "2", "3"}), ok_row({"4", "5", "6"})});

            test_quotes(test_read_pass, "Read test: quoted field then CR",
                    "\"1\"\r\"2\"\r\n", {ok_row({"1"}), ok_row({"2"})});

            test_quotes(test_read_pass, "Read test: empty line in middle",
                    "1,2,3\r\n\r\n4,5,6\r\n", {ok_row({"1", "2", "3"}), ok_row({""}), ok_row({"4", "5", "6"})});

            test_quotes(test_read_pass, "Read test: fewer than first row",
                    "1,2,3,4\r\n5,6,7\r\n", {ok_row({"1", "2", "3", "4"}), ok_row({"5", "6", "7"})});

            test_quotes(test_read_pass, "Read test: more than first row",
                    "1,2,3,4\r\n5,6,7,8,9\r\n", {ok_row({"1", "2", "3", "4"}), ok_row({"5", "6", "7", "8", "9"})});

            test_quotes(test_read_pass, "Read test: unterminated quote",
                    "\"1\r\n", {escape_error(1, "\"1\r", 1, true)});

            test_quotes(test_read_pass, "Read test: unterminated quote without newline",
                    "1,\"2", {escape_error(1, "\"2", 0, true)});

            test_quotes(test_read_pass, "Read test: unterminated quote then rows",
                    "a,b\n\"unterminated\nc,d\n",
                    {ok_row({"a", "b"}), escape_error(2, "\"unterminated", 2, true), ok_row({"c", "d"})});

            test_quotes(test_read_pass, "Read test: unterminated quote spanning a doubled quote",
                    "\"a\nb\"\"c\nd",
                    {escape_error(1, "\"a", 2, true), stray_error(2, "b\"\"c", true), ok_row({"d"})});

            {
                std::string test_str = "\"";
                Decoded_data data{escape_error(1, "\"x", 10)};
                for(int i = 0; i < 11; ++i)
                {
                    test_str += "x\n";
                    if(i > 0)
                        data.push_back(ok_row({"x"}));
                }
                test_str += "y\n";
                data.push_back(ok_row({"y"}));

                test_quotes(test_read_pass, "Read test: quote spanning too many lines", test_str, data);
            }

            test_quotes(test_read_pass, "Read test: unescaped quote",
                    "12\"3\r\n", {stray_error(1, "12\"3\r")});

            test_quotes(test_read_pass, "Read test: unescaped quote then row",
                    "1,2\"x,3\n4,5\n", {stray_error(1, "2\"x,3"), ok_row({"4", "5"})});

            test_quotes(test_read_pass, "Read test: unescaped quote at EOF",
                    "a,b\"c", {stray_error(1, "b\"c", true)});

            test_quotes(test_read_pass, "Read test: unescaped quote at end of field",
                    "123,234\"\r\n", {stray_error(1, "234\"\r")});

            test_quotes(test_read_pass, "Read test: unescaped quote inside quoted field",
                    "\"12\"3\"\r\n", {stray_error(1, "\"12\"3\"\r")});

            test_quotes(test_read_pass, "Read test: text after closing quote at EOF",
                    "\"a\"b", {stray_error(1, "\"a\"b", true)});

            test_quotes(test_read_pass, "Read test: error on second line",
                    "1,2\n3,4\"\n5,6\n", {ok_row({"1", "2"}), stray_error(2, "4\""), ok_row({"5", "6"})});

            test_quotes(test_read_pass, "Read test: stray quote after a multi-line escape resumes after its first newline",
                    "a\",\"be\n\"c,d\n\"e,f\"g\",h\nj,k\n",
                    {stray_error(1, "a\",\"be"), stray_error(3, "\"c,d\n\"e,f\"g\",h"), stray_error(3, "\"e,f\"g\",h"), ok_row({"j", "k"})});

            test_quotes(test_read_pass, "Read test: rows recovered after a multi-line stray quote",
                    "a,\"be\nc,\"d\"\ne,\"f\ng,",
                    {stray_error(2, "\"be\nc,\"d\""), ok_row({"c", "d"}), escape_error(3, "\"f", 1, true), ok_row({"g", ""})});

            test_quotes(test_read_pass, "Read test: multi-line stray quote on the last line",
                    "a,\"b,c\nd,e\n,f\"\" \"a",
                    {stray_error(3, "\"b,c\nd,e\n,f\"\" \"a", true), ok_row({"d", "e"}), stray_error(3, "f\"\" \"a", true)});

            test_quotes(test_read_fail, "Read test: Too many cols",
                    "1,2,3,4,5\r\n", {ok_row({"1", "2", "3", "4"})});

            test_quotes(test_read_fail, "Read test: Too few cols",
                    "1,2,3\r\n", {ok_row({"1", "2", "3", "4"})});

            test_quotes(test_read_fail, "Read test: Too many rows",
                    "1,2,3\r\n1,2,3\r\n", {ok_row({"1", "2", "3"})});

            test_quotes(test_read_fail, "Read test: Too few rows",
                    "1,2,3\r\n", {ok_row({"1", "2", "3"}), ok_row({"1", "2", "3"})});

            test_quotes(test_read_pass, "Read test: field reallocation",
                    "1,123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412342,3,4",
                    {ok_row({"1", "123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412341234123412342", "3", "4"})});

            {
                std::string test_str;
                const int test_nums = 42;
                csvstream::Row row;

                for(int i = 0; i < test_nums; ++i)
                {
                    auto num = std::to_string(i);
                    row.push_back(num);

                    test_str += num;
                    if(i < test_nums - 1)
                        test_str += ",";
                }
                test_str += "\r\n";

                test_quotes(test_read_pass, "Read test: fields reallocation", test_str, {ok_row(row)});
            }
        }

        if(!std::empty(test_write))
        {
            std::cout<<"\nWriter Tests:\n";

            test_quotes(test_write_pass, "Write test: empty file",
                    "", CSV_data{});

            test_quotes(test_write_pass, "Write test: 1 field",
                    "1\r\n", CSV_data{{"1"}});

            test_quotes(test_write_pass, "Write test: field with quotes",
                    "\"\"\"1\"\"\"\r\n", CSV_data{{"\"1\""}});

            test_quotes(test_write_pass, "Write test: 1 row",
                    "1,2,3,4\r\n", CSV_data{{"1","2","3","4"}});

            test_quotes(test_write_pass, "Write test: fields with commas",
                    "\"1,2,3\",\"4,5,6\"\r\n", CSV_data{{"1,2,3", "4,5,6"}});

            test_quotes(test_write_pass, "Write test: fields with newlines",
                    "\"1\r2\n3\",\"4\r\n5\n\r6\"\r\n", CSV_data{{"1\r2\n3", "4\r\n5\n\r6"}});

            test_quotes(test_write_pass, "Write test: field with commas & newlines",
                    "\",1\r\n\"\r\n", CSV_data{{",1\r\n"}});

            test_quotes(test_write_pass, "Write test: fields with commas & newlines & quotes",
                    "\",1\r\n\"\"\"\r\n", CSV_data{{",1\r\n\""}});

            test_quotes(test_write_pass, "Write test: multiple rows",
                    "1,2,3,4\r\n5,6,7,8\r\n", CSV_data{{"1", "2", "3", "4"}, {"5", "6", "7", "8"}});

            test_quotes(test_write_pass, "Write test: empty fields",
                    "1,2,3,\r\n,6,7,8\r\n", CSV_data{{"1", "2", "3", ""}, {"", "6", "7", "8"}});

            test_quotes(test_write_pass, "Write test: fewer than header",
                    "1,2,3,4\r\n5,6,7\r\n", CSV_data{{"1", "2", "3", "4"}, {"5", "6", "7"}});

            test_quotes(test_write_pass, "Write test: more than header",
                    "1,2,3,4\r\n5,6,7,8,9\r\n", CSV_data{{"1", "2", "3", "4"}, {"5", "6", "7", "8", "9"}});

            test_quotes(test_write_pass, "Write test: formula characters are not escaped by default",
                    "=1+1,@a\r\n", CSV_data{{"=1+1", "@a"}});

            std::cout<<"\n";
        }

        std::size_t unit_passed = 0;
        std::size_t unit_ran = 0;
        std::size_t unit_skipped = 0;
        if(!std::empty(unit_tests_))
        {
            std::cout<<"Unit Tests:\n";

            for(auto & [title, fun]: unit_tests_)
            {
                test::Test<> test_unit{fun};
                test_unit.test_pass(title);

                unit_passed += test_unit.get_num_passed();
                unit_ran += test_unit.get_num_ran();
                unit_skipped += test_unit.get_num_skipped();
            }

            std::cout<<"\n";
        }

        auto num_passed = test_read.get_num_passed() + test_write.get_num_passed() + unit_passed;
        auto num_ran = test_read.get_num_ran() + test_write.get_num_ran() + unit_ran;
        auto num_skipped = test_read.get_num_skipped() + test_write.get_num_skipped() + unit_skipped;

        if(num_passed == num_ran)
        {
            std::cout<<"All "<<num_passed<<" tests PASSED. ("<<num_skipped<<" tests skipped)\n";
            return true;
        }
        else
        {
            auto num_failed = num_ran - num_passed;
            std::cout<<num_passed<<" tests PASSED, "<<num_failed<<" tests FAILED. ("<<num_skipped<<" tests skipped)\n";
            return false;
        }
    }

private:
    static std::string replace(const std::string & text, const std::regex & pattern, const std::string & with)
    {
        return std::regex_replace(text, pattern, with);
    }

    // apply a replacement to every field and error sequence
    static Decoded_data replace(const Decoded_data & data, const std::regex & pattern, const std::string & with)
    {
        Decoded_data modified_data;
        for(auto & result: data)
        {
            if(result)
            {
                auto row = result.row();
                for(auto & col: row)
                    col = replace(col, pattern, with);
                modified_data.push_back(csvstream::Row_result::ok(std::move(row), result.line()));
            }
            else
            {
                auto info = result.error();
                info.sequence = replace(info.sequence, pattern, with);
                modified_data.push_back(csvstream::Row_result::error(std::move(info)));
            }
        }
        return modified_data;
    }

    static CSV_data replace(const CSV_data & data, const std::regex & pattern, const std::string & with)
    {
        CSV_data modified_data = data;
        for(auto & row: modified_data)
            for(auto & col: row)
                col = replace(col, pattern, with);
        return modified_data;
    }

    static csvstream::Decode_options make_options(csvstream::Decode_options, const char32_t separator, const char32_t escape_character)
    {
        csvstream::Decode_options options;
        options.separator = separator;
        options.escape_character = escape_character;
        return options;
    }

    static csvstream::Encode_options make_options(csvstream::Encode_options, const char32_t separator, const char32_t escape_character)
    {
        csvstream::Encode_options options;
        options.separator = separator;
        options.escape_character = escape_character;
        return options;
    }

    // helper to run a test for each combination of separator and escape char
    template<typename Test, typename Data>
    static void test_quotes(Test test, const std::string & title, const std::string & csv_text, const Data & data)
    {
        using Options = std::conditional_t<std::is_same_v<Data, CSV_data>, csvstream::Encode_options, csvstream::Decode_options>;

        const std::regex comma{","};
        const std::regex quote{"\""};

        test(title, csv_text, data, make_options(Options{}, U',', U'"'));

        test(title + " w/ pipe separator", replace(csv_text, comma, "|"), replace(data, comma, "|"), make_options(Options{}, U'|', U'"'));

        test(title + " w/ single quote", replace(csv_text, quote, "'"), replace(data, quote, "'"), make_options(Options{}, U',', U'\''));

        test(title + " w/ pipe separator & single quote",
                replace(replace(csv_text, comma, "|"), quote, "'"),
                replace(replace(data, comma, "|"), quote, "'"),
                make_options(Options{}, U'|', U'\''));
    }

    // Decoded_data can't be deduced from a braced list
    template<typename Test>
    static void test_quotes(Test test, const std::string & title, const std::string & csv_text, const std::initializer_list<csvstream::Row_result> & data)
    {
        test_quotes(test, title, csv_text, Decoded_data{data});
    }

    std::vector<Read_test_fun> read_tests_;
    std::vector<Write_test_fun> write_tests_;
    std::vector<std::pair<std::string, Unit_test_fun>> unit_tests_;
};

#endif // CSV_TEST_SUITE_HPP
