#include <igm/util/log.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <igm/util.hpp>

#ifndef IGM_SOURCE_ROOT
#define IGM_SOURCE_ROOT ""
#endif

struct Log::Sinks
{
    struct Hook
    {
        uint32_t m_Id;
        LogHook m_Callback;
    };

    std::mutex m_Mutex;
    std::ofstream m_File;
    std::vector<Hook> m_Hooks;
    uint32_t m_NextHookId{ 1 };
};

namespace
{
inline constexpr std::size_t c_MaxLogFiles{ 256 };

std::shared_mutex g_LogsMutex;
std::unordered_map<std::string, Log*> g_Logs;

std::shared_mutex g_ThreadNamesMutex;
std::unordered_map<std::thread::id, std::string> g_ThreadNames;

std::string_view LevelTag(Log::LogLevel level)
{
    switch (level)
    {
    case Log::LogLevel::Information:
        return " [INFO]";
    case Log::LogLevel::Debug:
        return "[DEBUG]";
    case Log::LogLevel::Warning:
        return " [WARN]";
    case Log::LogLevel::Error:
        return "[ERROR]";
    case Log::LogLevel::Fatal:
        break;
    }
    return "[FATAL]";
}

// One file per run in ./logs, the oldest files are deleted beyond c_MaxLogFiles
std::ofstream OpenLogFile()
{
    const fs::path logs_folder{ fs::absolute("logs") };

    std::error_code error;
    fs::create_directories(logs_folder, error);
    if (error || !fs::is_directory(logs_folder))
    {
        qWarning().noquote() << QString::fromStdString(
            fmt::format("Can't create log folder {}, logging to console only", logs_folder.string()));
        return {};
    }

    std::multimap<fs::file_time_type, fs::path> old_logs;
    for (const auto& entry : fs::directory_iterator{ logs_folder })
    {
        if (entry.is_regular_file() && entry.path().extension() == ".log")
        {
            old_logs.emplace(entry.last_write_time(), entry.path());
        }
    }
    while (old_logs.size() >= c_MaxLogFiles)
    {
        fs::remove(old_logs.begin()->second, error);
        old_logs.erase(old_logs.begin());
    }

    const fs::path log_file{
        logs_folder / fmt::format("{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr)))
    };
    return std::ofstream{ log_file, std::ios::app };
}
} // namespace

Log::Log(LogFlags log_flags, std::string_view log_name)
    : m_Name{ log_name }
    , m_Flags{ log_flags }
    , m_Sinks{ std::make_unique<Sinks>() }
{
    if (IsSet(m_Flags, LogFlags::File))
    {
        m_Sinks->m_File = OpenLogFile();
    }

    // Last, nothing may throw after this log is visible to other threads
    std::unique_lock lock{ g_LogsMutex };
    if (!g_Logs.try_emplace(m_Name, this).second)
    {
        throw std::logic_error{ fmt::format("Log {} is already registered", m_Name) };
    }
}

Log::~Log()
{
    std::unique_lock lock{ g_LogsMutex };
    g_Logs.erase(m_Name);
}

Log* Log::GetInstance(std::string_view log_name)
{
    std::shared_lock lock{ g_LogsMutex };
    const auto it{ g_Logs.find(std::string{ log_name }) };
    return it != g_Logs.end() ? it->second : nullptr;
}

bool Log::RegisterThreadName(std::string_view thread_name)
{
    std::unique_lock lock{ g_ThreadNamesMutex };
    return g_ThreadNames.try_emplace(std::this_thread::get_id(), thread_name).second;
}

std::string_view Log::GetThreadName(const std::thread::id& thread_id)
{
    std::shared_lock lock{ g_ThreadNamesMutex };
    const auto it{ g_ThreadNames.find(thread_id) };
    if (it == g_ThreadNames.end())
    {
        return "Unregistered";
    }
    return it->second;
}

uint32_t Log::InstallHook(LogHook hook)
{
    std::lock_guard lock{ m_Sinks->m_Mutex };
    const uint32_t hook_id{ m_Sinks->m_NextHookId++ };
    m_Sinks->m_Hooks.push_back({ hook_id, std::move(hook) });
    return hook_id;
}

void Log::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Sinks->m_Mutex };
    std::erase_if(m_Sinks->m_Hooks,
                  [hook_id](const Sinks::Hook& hook)
                  {
                      return hook.m_Id == hook_id;
                  });
}

bool Log::GetStacktraceEnabled(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
        return IsSet(m_Flags, LogFlags::DetailErrorStacktrace);
    case LogLevel::Fatal:
        return IsSet(m_Flags, LogFlags::DetailFatalStacktrace);
    default:
        return false;
    }
}

void Log::PrintRaw(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    const std::string line{ Format(detail_info, level, message) };

    {
        std::lock_guard lock{ m_Sinks->m_Mutex };

        if (IsSet(m_Flags, LogFlags::Console))
        {
            qDebug().noquote() << QString::fromStdString(line);
        }

        if (m_Sinks->m_File.is_open())
        {
            m_Sinks->m_File << line << '\n'
                            << std::flush;
        }

        for (const Sinks::Hook& hook : m_Sinks->m_Hooks)
        {
            hook.m_Callback(detail_info, level, message);
        }
    }

    if (level == LogLevel::Fatal && IsSet(m_Flags, LogFlags::FatalQuit))
    {
        std::exit(-1);
    }
}

std::string Log::Format(const DetailInformation& detail_info, LogLevel level, std::string_view message) const
{
    std::string line;

    // A leading newline stays in front of the tag
    if (message.starts_with('\n'))
    {
        line.push_back('\n');
        message.remove_prefix(1);
    }
    line += LevelTag(level);

    std::vector<std::string> details;
    if (IsSet(m_Flags, LogFlags::DetailTime))
    {
        details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
    }
    if (IsSet(m_Flags, LogFlags::DetailFile))
    {
        std::string_view file{ detail_info.m_File };
        if (file.starts_with(IGM_SOURCE_ROOT))
        {
            file.remove_prefix(std::strlen(IGM_SOURCE_ROOT));
        }
        details.emplace_back(file);
    }
    if (IsSet(m_Flags, LogFlags::DetailColumn))
    {
        details.push_back(fmt::format("{}:{}", detail_info.m_Line, detail_info.m_Column));
    }
    else if (IsSet(m_Flags, LogFlags::DetailLine))
    {
        details.push_back(fmt::format("{}", detail_info.m_Line));
    }
    if (IsSet(m_Flags, LogFlags::DetailFunction))
    {
        details.emplace_back(detail_info.m_Function);
    }
    if (IsSet(m_Flags, LogFlags::DetailThread))
    {
        details.emplace_back(detail_info.m_Thread);
    }
    if (!details.empty())
    {
        line += fmt::format("<{}>", fmt::join(details, "; "));
    }

    line += fmt::format(": {}", message);

    if (GetStacktraceEnabled(level))
    {
        if (detail_info.m_StackTrace.empty())
        {
            line += "\n[[Stacktrace not available]]";
        }
        else
        {
            line += fmt::format("\nStacktrace:\n{}", fmt::join(detail_info.m_StackTrace, "\n"));
        }
    }

    return line;
}
