#include "core/rename_resolver.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/StreamCopier.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

namespace
{
    std::string trimQuotes(const std::string &value)
    {
        const std::string strip_chars = " \t\r\"'";
        size_t start = value.find_first_not_of(strip_chars);
        if (start == std::string::npos)
            return "";
        size_t end = value.find_last_not_of(strip_chars);
        return value.substr(start, end - start + 1);
    }

    std::string joinCommand(const std::string &executable, const std::vector<std::string> &args)
    {
        std::string command = executable;
        for (const auto &arg : args)
            command += " " + arg;
        return command;
    }
}

std::unique_ptr<RenameResolver> RenameResolver::create(const RenamerSettings &settings)
{
    if (settings.enabled)
    {
        return std::make_unique<MnamerRenameResolver>(settings);
    }
    Logger::info("External renamer disabled, original filenames are kept");
    return std::make_unique<PassthroughRenameResolver>();
}

NameProposal PassthroughRenameResolver::proposeName(const std::string &file_path)
{
    NameProposal proposal;
    proposal.success = true;
    proposal.filename = FileUtils::sanitizeFilename(fs::path(file_path).filename().string());
    proposal.output = "renamer disabled, keeping " + proposal.filename;
    return proposal;
}

MnamerRenameResolver::MnamerRenameResolver(const RenamerSettings &settings)
    : settings_(settings)
{
}

std::vector<std::string> MnamerRenameResolver::buildArguments(const std::string &file_path) const
{
    std::vector<std::string> args;
    if (settings_.batch_mode)
        args.push_back("--batch");
    args.push_back("--media");
    args.push_back(settings_.media_type);
    if (!settings_.movie_format.empty())
    {
        args.push_back("--movie-format");
        args.push_back(settings_.movie_format);
    }
    args.insert(args.end(), settings_.extra_args.begin(), settings_.extra_args.end());
    args.push_back(file_path);
    return args;
}

std::optional<std::string> MnamerRenameResolver::parseOutput(const std::string &output)
{
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line))
        lines.push_back(line);

    const std::string arrows[] = {"->", "\xE2\x86\x92"};
    for (const auto &current : lines)
    {
        for (const auto &arrow : arrows)
        {
            size_t pos = current.rfind(arrow);
            if (pos == std::string::npos)
                continue;
            std::string name = fs::path(trimQuotes(current.substr(pos + arrow.size()))).filename().string();
            if (!name.empty())
                return name;
        }
    }

    const std::string marker = "renamed to";
    for (const auto &current : lines)
    {
        size_t pos = FileUtils::toLower(current).rfind(marker);
        if (pos == std::string::npos)
            continue;
        std::string name = fs::path(trimQuotes(current.substr(pos + marker.size()))).filename().string();
        if (!name.empty())
            return name;
    }

    return std::nullopt;
}

NameProposal MnamerRenameResolver::proposeName(const std::string &file_path)
{
    NameProposal proposal;

    std::error_code ec;
    if (!fs::exists(file_path, ec))
    {
        proposal.error_message = "File does not exist: " + file_path;
        return proposal;
    }
    if (!fs::is_regular_file(file_path, ec))
    {
        proposal.error_message = "Path is not a file: " + file_path;
        return proposal;
    }

    std::vector<std::string> args = buildArguments(file_path);
    Logger::info("Running mnamer: " + joinCommand(settings_.executable_path, args));

    try
    {
        Poco::Pipe out_pipe;
        Poco::ProcessHandle handle = Poco::Process::launch(settings_.executable_path, args, nullptr, &out_pipe, &out_pipe);

        // Watchdog kills the child once the timeout elapses
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        std::atomic<bool> timed_out{false};
        std::thread watchdog([&]()
                             {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv.wait_for(lock, std::chrono::seconds(settings_.timeout_seconds), [&] { return finished; }))
            {
                timed_out = true;
                try
                {
                    Poco::Process::kill(handle);
                }
                catch (const Poco::Exception &e)
                {
                    Logger::warn("Failed to kill mnamer process: " + e.displayText());
                }
            } });

        std::string output;
        std::string read_error;
        int exit_code = -1;
        try
        {
            Poco::PipeInputStream istr(out_pipe);
            Poco::StreamCopier::copyToString(istr, output);
            exit_code = handle.wait();
        }
        catch (const Poco::Exception &e)
        {
            read_error = e.displayText();
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            finished = true;
        }
        cv.notify_all();
        watchdog.join();

        proposal.output = output;
        if (timed_out)
        {
            proposal.error_message = "mnamer timed out for file: " + file_path;
            Logger::error(proposal.error_message);
            return proposal;
        }
        if (!read_error.empty())
        {
            proposal.error_message = "Error reading mnamer output: " + read_error;
            Logger::error(proposal.error_message);
            return proposal;
        }
        Logger::debug("mnamer exit code: " + std::to_string(exit_code));
        Logger::debug("mnamer output: " + output);

        if (exit_code != 0)
        {
            proposal.error_message = "mnamer failed with exit code " + std::to_string(exit_code);
            Logger::warn(proposal.error_message);
            return proposal;
        }

        auto parsed = parseOutput(output);
        if (!parsed)
        {
            proposal.error_message = "Could not parse mnamer output for new filename";
            Logger::warn(proposal.error_message);
            return proposal;
        }

        proposal.filename = FileUtils::sanitizeFilename(*parsed);
        proposal.success = true;
        Logger::info("mnamer renamed file to: " + proposal.filename);
    }
    catch (const Poco::Exception &e)
    {
        proposal.error_message = "Error running mnamer (" + settings_.executable_path + "): " + e.displayText();
        Logger::error(proposal.error_message);
    }
    catch (const std::exception &e)
    {
        proposal.error_message = "Error running mnamer: " + std::string(e.what());
        Logger::error(proposal.error_message);
    }
    return proposal;
}
