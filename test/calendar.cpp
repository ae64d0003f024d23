#include <xduce/collect.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

/*
[        D ](https://wiki.dlang.org/Component_programming_with_ranges)
[     Rust ](https://gist.github.com/DanielKeep/7c87e697d5810803d069)
[ range-v3 ](https://github.com/ericniebler/range-v3/blob/master/example/calendar.cpp)
[  Haskell ](https://github.com/BartoszMilewski/Calendar/blob/master/Main.hs)
*/
namespace greg  = boost::gregorian;
namespace td    = xduce::td;
using date_t    = greg::date;
using dates_t   = std::vector<date_t>;
using week_t    = std::pair<unsigned short, std::string>; // (month, formatted week)
using month_t   = std::vector<week_t>;

#define VERIFY(expr) if(!(expr)) XDUCE_TD_THROW("Assertion failed: ( "#expr" ).");

static void MakeCalendar(const uint16_t year,
                         const  uint8_t num_months_horizontally,
                          std::ostream& ostr)
{
    if(num_months_horizontally < 1) {
        throw std::invalid_argument("Number of months per row must be at least 1.");
    }

    const auto days_of_year = td::compose(
        td::map([year](int i)
        {
            return date_t( year, greg::Jan, 1 ) + greg::date_duration{ i };
        }),
        td::take_while([year](const date_t& d)
        {
            return d.year() == year;
        }));

    const auto weeks = td::partition_by(days_of_year, td::range(0, 367), [](const date_t& d)
    {
        return std::make_pair(d.month().as_number(), d.week_number());
    });

    // format a line for a week, e.g. "       1  2  3  4  5"
    const auto formatted_weeks = td::to_vector(
        td::map([](dates_t wk_dates) -> week_t
        {
            const auto left_pad_amt =
                size_t(3 * ((wk_dates.front().day_of_week() + 7 - 1) % 7));

            return { wk_dates.front().month().as_number(),
                     td::reduce(td::identity(), wk_dates, std::string(left_pad_amt, ' '),
                                [](std::string ret_wk, const date_t& d)
                        {
                            return td::cont(std::move(ret_wk)
                                          + (d.day() < 10 ? "  " : " ")
                                          + std::to_string(d.day()));
                        }) };
        }),
        weeks);

    const auto months = td::partition_by(td::identity(), formatted_weeks, [](const week_t& wk)
    {
        return wk.first;
    });

    const auto groups = td::partition_by(td::identity(), months, [num_months_horizontally](const month_t& mo)
    {
        return (mo.front().first - 1) / num_months_horizontally;
    });

    static const std::array<std::string, 12> s_month_names{{
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" }};

    for(const auto& group : groups) {
        for(int row = -2; row < 6; row++) { // month-name + weekdays-header + up to 6 week-lines
            for(const auto& mo : group) {
                ostr << std::setiosflags(std::ios::left)
                     << std::setw(25)
                     << (   row == -2        ?  "        " + s_month_names.at(mo.front().first - 1u)
                   :        row == -1        ?  std::string(" Mo Tu We Th Fr Sa Su")
                   : size_t(row) < mo.size() ?  mo[size_t(row)].second // formatted week
                   :                            std::string(21, ' '));
            }
            ostr << "\n";
        }
    }
}

// Spot-check the rendering of 2019, three months per row.
static void VerifyCalendar(const std::string& text)
{
    std::vector<std::string> lines{};
    std::istringstream istr(text);
    for(std::string line; std::getline(istr, line); ) {
        lines.push_back(line);
    }

    VERIFY(lines.size() == 4 * 8);

    VERIFY(lines[0].substr(0, 25) == "        Jan              ");
    VERIFY(lines[1].substr(0, 25) == " Mo Tu We Th Fr Sa Su    ");

    // Jan 1 2019 is a Tuesday, Feb 1 a Friday
    VERIFY(lines[2].substr(0, 25)  == "     1  2  3  4  5  6    ");
    VERIFY(lines[2].substr(25, 25) == "              1  2  3    ");
    VERIFY(lines[3].substr(0, 25)  == "  7  8  9 10 11 12 13    ");

    // Dec 1 2019 is a Sunday
    VERIFY(lines[24].substr(50, 11) == "        Dec");
    VERIFY(lines[26].substr(50, 21) == std::string(18, ' ') + "  1");
}

int main(int argc, char* argv[])
{
    try {
        if(argc > 1) {
            const auto year = uint16_t(std::stoi(argv[1]));
            const auto num_months_horizontally = uint8_t(argc > 2 ? std::stoi(argv[2]) : 3);

            MakeCalendar(year, num_months_horizontally, std::cout);
            return 0;
        }

        std::ostringstream ostr;
        MakeCalendar(2019, 3, ostr);
        VerifyCalendar(ostr.str());
        std::cout << ostr.str();

    } catch(const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}

/*
Output:
        Jan                      Feb                      Mar
 Mo Tu We Th Fr Sa Su     Mo Tu We Th Fr Sa Su     Mo Tu We Th Fr Sa Su
     1  2  3  4  5  6                  1  2  3                  1  2  3
  7  8  9 10 11 12 13      4  5  6  7  8  9 10      4  5  6  7  8  9 10
 14 15 16 17 18 19 20     11 12 13 14 15 16 17     11 12 13 14 15 16 17
 21 22 23 24 25 26 27     18 19 20 21 22 23 24     18 19 20 21 22 23 24
 28 29 30 31              25 26 27 28              25 26 27 28 29 30 31

...
*/
