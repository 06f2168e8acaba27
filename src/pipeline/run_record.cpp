#include "pipeline/run_record.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace rehost::pipeline
{
    namespace
    {

        std::mutex &appendMutex()
        {
            static std::mutex mutex;
            return mutex;
        }

        class FileLock
        {
        public:
            explicit FileLock(const fs::path &path)
            {
                fd_ = open(path.c_str(), O_RDWR | O_CREAT, 0644);
                if (fd_ >= 0 && flock(fd_, LOCK_EX) != 0)
                {
                    close(fd_);
                    fd_ = -1;
                }
            }

            ~FileLock()
            {
                if (fd_ >= 0)
                {
                    flock(fd_, LOCK_UN);
                    close(fd_);
                }
            }

            FileLock(const FileLock &) = delete;
            FileLock &operator=(const FileLock &) = delete;

            bool locked() const { return fd_ >= 0; }

        private:
            int fd_ = -1;
        };

    } // namespace

    std::string toString(StageStatus status)
    {
        switch (status)
        {
        case StageStatus::Success:
            return "success";
        case StageStatus::Failure:
            return "failure";
        case StageStatus::Skipped:
            return "skipped";
        }
        return "skipped";
    }

    std::string toString(FinalStatus status)
    {
        switch (status)
        {
        case FinalStatus::Success:
            return "success";
        case FinalStatus::PartialSuccess:
            return "partial_success";
        case FinalStatus::Failure:
            return "failure";
        }
        return "failure";
    }

    json toJson(const PipelineRun &run)
    {
        json stages = json::array();
        for (const auto &stage : run.stages)
        {
            stages.push_back({
                {"name", stage.name},
                {"status", toString(stage.status)},
                {"duration_seconds", stage.durationSeconds},
                {"detail", stage.detail},
            });
        }

        return {
            {"run_id", run.runId},
            {"firmware_id", run.firmwareId},
            {"android_version", run.androidVersion},
            {"checkout_id", run.checkoutId},
            {"started_at", run.startedAt},
            {"stages", stages},
            {"final_status", toString(run.finalStatus)},
            {"warnings", run.warnings},
        };
    }

    std::string makeRunId()
    {
        static std::mutex mutex;
        static std::mt19937_64 engine{std::random_device{}()};

        std::lock_guard<std::mutex> lock(mutex);
        std::uniform_int_distribution<unsigned int> byte(0, 255);
        std::ostringstream out;
        out << std::hex << std::setfill('0');
        for (int i = 0; i < 16; ++i)
        {
            unsigned int value = byte(engine);
            if (i == 6)
            {
                value = (value & 0x0f) | 0x40;
            }
            else if (i == 8)
            {
                value = (value & 0x3f) | 0x80;
            }
            if (i == 4 || i == 6 || i == 8 || i == 10)
            {
                out << '-';
            }
            out << std::setw(2) << value;
        }
        return out.str();
    }

    std::string isoTimestamp(std::chrono::system_clock::time_point when)
    {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return out.str();
    }

    std::vector<json> RunLog::readAll() const
    {
        std::vector<json> out;
        std::error_code ec;
        if (!fs::exists(file_, ec))
        {
            return out;
        }
        const json data = io::loadJsonDocument(file_);
        if (!data.is_array())
        {
            throw std::runtime_error("Run log is not a JSON array: " + file_.string());
        }
        for (const auto &item : data)
        {
            out.push_back(item);
        }
        return out;
    }

    bool RunLog::append(const PipelineRun &run, const rehost::Context &ctx) const
    {
        if (!file_.parent_path().empty() && !io::ensureDir(file_.parent_path()))
        {
            ctx.error("Could not create run log directory ", file_.parent_path().string());
            return false;
        }

        std::lock_guard<std::mutex> guard(appendMutex());
        FileLock lock(file_.string() + ".lock");
        if (!lock.locked())
        {
            ctx.error("Could not lock run log ", file_.string(), ": ", std::strerror(errno));
            return false;
        }

        json records = json::array();
        try
        {
            for (auto &record : readAll())
            {
                records.push_back(std::move(record));
            }
        }
        catch (const std::exception &e)
        {
            ctx.error("Refusing to overwrite run log: ", e.what());
            return false;
        }

        records.push_back(toJson(run));
        if (!io::writeJsonFile(file_, records))
        {
            ctx.error("Could not write run log ", file_.string());
            return false;
        }
        ctx.debug("Run ", run.runId, " appended to ", file_.string());
        return true;
    }

} // namespace rehost::pipeline
