#include "ConsoleReporter.hpp"
#include "../config/MonitorConfig.hpp"
#include "../utils/StringUtils.hpp"

#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace console
{

namespace
{

constexpr const char* kReset = "\033[0m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kDim = "\033[2m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kBlue = "\033[34m";
constexpr const char* kMagenta = "\033[35m";
constexpr const char* kCyan = "\033[36m";
constexpr const char* kWhite = "\033[37m";
constexpr const char* kBoldGreen = "\033[1;32m";
constexpr const char* kBoldCyan = "\033[1;36m";
constexpr const char* kBoldWhite = "\033[1;37m";

constexpr std::size_t kBoxWidth = 50;
constexpr std::size_t kEmailWidth = 35;

const char* const kSpinner[] = { "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏" };
constexpr std::size_t kSpinnerFrames = sizeof(kSpinner) / sizeof(kSpinner[0]);

std::string repeat(const char* s, std::size_t n)
{
    std::string out;
    for (std::size_t i = 0; i < n; ++i)
        out += s;
    return out;
}

std::string clockNow()
{
    auto t = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S");
    return oss.str();
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, bool use_color)
    : out_(out)
    , use_color_(use_color)
{
}

std::string ConsoleReporter::boxTop(const char* color) const
{
    return std::string(c(color)) + "╭" + repeat("─", kBoxWidth) + c(kReset);
}

std::string ConsoleReporter::boxBottom(const char* color) const
{
    return std::string(c(color)) + "╰" + repeat("─", kBoxWidth) + c(kReset);
}

std::string ConsoleReporter::boxLine(const char* color, const std::string& content) const
{
    return std::string(c(color)) + "│" + c(kReset) + " " + content;
}

void ConsoleReporter::clearLine() { out_ << "\r" << std::string(80, ' ') << "\r"; }

const char* ConsoleReporter::spinnerFrame(std::size_t index) const
{
    return use_color_ ? kSpinner[index % kSpinnerFrames] : "*";
}

std::string ConsoleReporter::formatRemaining(std::chrono::milliseconds remaining)
{
    // Round to the nearest second, like a countdown.
    auto total = (remaining.count() + 500) / 1000;
    std::ostringstream oss;
    if (total >= 3600)
    {
        oss << total / 3600 << "h";
        total %= 3600;
        oss << total / 60 << "m" << total % 60 << "s";
    }
    else if (total >= 60)
    {
        oss << total / 60 << "m" << total % 60 << "s";
    }
    else
    {
        oss << total << "s";
    }
    return oss.str();
}

void ConsoleReporter::printBanner()
{
    out_ << "\n"
         << c(kBoldCyan) << "  ___  ___  __ _| |___      ____ _| |_ ___| |__" << c(kReset) << "\n"
         << c(kCyan) << " / __|/ _ \\/ _` | __\\ \\ /\\ / / _` | __/ __| '_ \\" << c(kReset) << "\n"
         << c(kCyan) << " \\__ \\  __/ (_| | |_ \\ V  V / (_| | || (__| | | |" << c(kReset) << "\n"
         << c(kBlue) << " |___/\\___|\\__,_|\\__| \\_/\\_/ \\__,_|\\__\\___|_| |_|" << c(kReset) << "\n\n"
         << c(kDim) << "  Virginia Tech Course Availability Monitor" << c(kReset) << "\n\n";
}

void ConsoleReporter::printSummary(const seatwatch::MonitorConfig& config)
{
    destination_ = config.notify.email;
    const auto interval = std::chrono::duration_cast<std::chrono::seconds>(config.check_interval).count();

    out_ << boxTop(kDim) << "\n";
    out_ << boxLine(kDim, std::string(c(kCyan)) + "Monitoring " + c(kBoldWhite) + std::to_string(config.crns.size()) +
                              " CRNs" + c(kReset))
         << "\n";
    if (!config.notify.email.empty())
    {
        out_ << boxLine(kDim, std::string(c(kMagenta)) + "Email: " + c(kWhite) +
                                  utils::truncate(config.notify.email, kEmailWidth) + c(kReset))
             << "\n";
    }
    out_ << boxLine(kDim, std::string(c(kYellow)) + "Interval: " + c(kBoldWhite) + std::to_string(interval) + "s" +
                              c(kReset) + "  " + c(kCyan) + "Term: " + c(kBoldWhite) + config.timetable.term +
                              c(kReset))
         << "\n";
    out_ << boxBottom(kDim) << "\n\n";
}

void ConsoleReporter::printError(const std::string& message)
{
    out_ << c(kRed) << "x " << c(kReset) << message << "\n";
}

void ConsoleReporter::onResolveStarted(std::size_t)
{
    out_ << c(kDim) << "Fetching course information..." << c(kReset) << "\n\n";
}

void ConsoleReporter::onEntityResolved(const seatwatch::Entity& entity)
{
    out_ << "  " << c(kGreen) << "+" << c(kReset) << " " << c(kCyan) << entity.id << c(kReset) << " " << c(kDim)
         << ">" << c(kReset) << " " << entity.display_name << "\n";
}

void ConsoleReporter::onEntityRejected(const std::string& id, const std::string&)
{
    out_ << "  " << c(kRed) << "x" << c(kReset) << " " << c(kDim) << id << c(kReset) << ": " << c(kRed)
         << "not found, skipping" << c(kReset) << "\n";
}

void ConsoleReporter::onCheckStarted(std::size_t attempt, const seatwatch::Entity& entity)
{
    if (!separator_printed_)
    {
        separator_printed_ = true;
        out_ << "\n" << c(kDim) << repeat("─", kBoxWidth + 2) << c(kReset) << "\n\n";
    }
    if (!in_cycle_)
    {
        in_cycle_ = true;
        cycle_clock_ = clockNow();
    }
    out_ << "\r" << c(kCyan) << spinnerFrame(attempt) << c(kReset) << " " << c(kBold) << "Attempt #" << attempt
         << c(kReset) << " " << c(kDim) << "|" << c(kReset) << " Checking " << c(kCyan) << entity.id << c(kReset)
         << "...                              " << std::flush;
}

void ConsoleReporter::onCheckFinished(std::size_t, const seatwatch::EntityCheck& check)
{
    using seatwatch::CheckOutcome;

    switch (check.outcome)
    {
    case CheckOutcome::StillPending:
        break;
    case CheckOutcome::LookupFailed:
        out_ << "\r" << c(kRed) << "x" << c(kReset) << " " << c(kDim) << "[" << cycle_clock_ << "]" << c(kReset)
             << " Error checking " << check.id << ": " << check.error << "\n";
        break;
    case CheckOutcome::FoundNow:
    case CheckOutcome::NotifyFailed:
        clearLine();
        out_ << "\n";
        out_ << boxTop(kGreen) << "\n";
        out_ << boxLine(kGreen, std::string(c(kBoldGreen)) + "SEAT AVAILABLE!" + c(kReset)) << "\n";
        out_ << boxLine(kGreen, std::string("  ") + c(kWhite) + check.display_name + c(kReset)) << "\n";
        out_ << boxLine(kGreen, std::string("  ") + c(kDim) + "CRN: " + check.id + c(kReset)) << "\n";
        out_ << boxBottom(kGreen) << "\n";
        if (check.notification_sent)
        {
            out_ << "  " << c(kMagenta) << "@" << c(kReset) << " " << c(kDim) << "Notification sent to "
                 << destination_ << c(kReset) << "\n\n";
        }
        else if (check.outcome == CheckOutcome::NotifyFailed)
        {
            out_ << "  " << c(kRed) << "x" << c(kReset) << " Notification failed: " << check.error << "\n\n";
        }
        break;
    }
    out_ << std::flush;
}

void ConsoleReporter::onCycleFinished(const seatwatch::CycleReport&, std::size_t, std::size_t)
{
    in_cycle_ = false;
    wait_ticks_ = 0;
}

void ConsoleReporter::onWaitTick(std::size_t attempt, std::size_t found, std::size_t total,
                                 std::chrono::milliseconds remaining)
{
    out_ << "\r" << c(kCyan) << spinnerFrame(wait_ticks_++) << c(kReset) << " " << c(kBold) << "Attempt #"
         << attempt << c(kReset) << " " << c(kDim) << "|" << c(kReset) << " Found: " << c(kGreen) << found
         << c(kReset) << "/" << c(kDim) << total << c(kReset) << " " << c(kDim) << "|" << c(kReset)
         << " Next: " << c(kYellow) << formatRemaining(remaining) << c(kReset) << " " << c(kDim) << "["
         << cycle_clock_ << "]" << c(kReset) << "          " << std::flush;
}

void ConsoleReporter::onSessionFinished(seatwatch::SessionOutcome outcome, std::size_t found, std::size_t total)
{
    using seatwatch::SessionOutcome;

    switch (outcome)
    {
    case SessionOutcome::AllFound:
        out_ << "\n" << c(kBoldGreen) << "All courses found! Exiting..." << c(kReset) << "\n";
        break;
    case SessionOutcome::Cancelled:
        clearLine();
        out_ << "\n" << c(kYellow) << "Interrupted. " << found << "/" << total << " found." << c(kReset) << "\n";
        break;
    case SessionOutcome::NoValidTargets:
        out_ << "\n" << c(kRed) << "No valid CRNs to monitor." << c(kReset) << "\n";
        break;
    }
    out_ << std::flush;
}

} // namespace console
