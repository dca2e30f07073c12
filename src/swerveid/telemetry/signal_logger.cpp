#include "swerveid/telemetry/signal_logger.hpp"
#include <stdexcept>

namespace swerveid::telemetry
{
    SignalLogger::SignalLogger(const SignalLoggerConfig &config, const util::IClock *clock)
        : config_(config),
          clock_(clock),
          file_(nullptr),
          segment_counter_(0),
          current_filename_("")
    {
        if (!clock_)
        {
            throw std::invalid_argument("SignalLogger: clock cannot be null");
        }
        if (config_.name.empty())
        {
            throw std::invalid_argument("SignalLogger: name cannot be empty");
        }

        open_new_file("");
    }

    SignalLogger::~SignalLogger()
    {
        close_current_file();
    }

    void SignalLogger::write_string(const std::string &key, const std::string &value)
    {
        if (!file_)
            return;

        fprintf(file_, "%lu,%s,%s,%s\n",
                static_cast<unsigned long>(timestamp_ms()),
                key.c_str(),
                signal_type_to_string(SignalType::STRING),
                value.c_str());

        // State changes are rare; flush so a brownout doesn't lose them
        fflush(file_);
    }

    void SignalLogger::write_double(const std::string &key, double value)
    {
        if (!file_)
            return;

        fprintf(file_, "%lu,%s,%s,%.6f\n",
                static_cast<unsigned long>(timestamp_ms()),
                key.c_str(),
                signal_type_to_string(SignalType::DOUBLE),
                value);
    }

    void SignalLogger::mark(const std::string &segment_name)
    {
        std::string actual_name = segment_name;
        if (actual_name.empty())
        {
            actual_name = "segment_" + std::to_string(segment_counter_);
            segment_counter_++;
        }

        open_new_file(actual_name);
    }

    void SignalLogger::open_new_file(const std::string &segment_name)
    {
        close_current_file();

        current_filename_ = generate_filename(segment_name);
        file_ = fopen(current_filename_.c_str(), "w");

        if (!file_)
        {
            // Keep running without logging
            return;
        }

        fprintf(file_, "timestamp_ms,key,type,value\n");
        fflush(file_);
    }

    void SignalLogger::close_current_file()
    {
        if (file_)
        {
            fflush(file_);
            fclose(file_);
            file_ = nullptr;
        }
    }

    uint32_t SignalLogger::timestamp_ms() const
    {
        return clock_->now().to_millis_uint();
    }

    std::string SignalLogger::generate_filename(const std::string &segment_name) const
    {
        std::string filename = config_.directory + "/" + config_.name;
        if (!segment_name.empty())
        {
            filename += "_" + segment_name;
        }
        return filename + ".csv";
    }
}
