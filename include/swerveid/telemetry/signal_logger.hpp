#pragma once

#include "swerveid/telemetry/signal_log.hpp"
#include "swerveid/util/clock.hpp"
#include <cstdio>
#include <string>

namespace swerveid::telemetry
{
    struct SignalLoggerConfig
    {
        std::string directory = "/usd"; // SD card mount on the V5 brain
        std::string name = "sysid";
    };

    /**
     * @brief CSV file sink for characterization signals
     *
     * Every write becomes one row: timestamp_ms,key,type,value.
     * Timestamps are taken from the supplied clock.
     *
     * mark() closes the current file and opens <name>_<segment>.csv so each
     * test run can land in its own file.
     *
     * If the file cannot be opened the logger stays usable and drops writes;
     * the robot keeps running without an SD card.
     *
     * @example
     * util::ProsClock clock;
     * SignalLogger logger({.directory = "/usd", .name = "swerve_sysid"}, &clock);
     * logger.write_string("SysIdTranslation_State", "quasistatic-forward");
     */
    class SignalLogger : public ISignalLog
    {
    public:
        SignalLogger(const SignalLoggerConfig &config, const util::IClock *clock);
        ~SignalLogger();

        SignalLogger(const SignalLogger &) = delete;
        SignalLogger &operator=(const SignalLogger &) = delete;

        void write_string(const std::string &key, const std::string &value) override;
        void write_double(const std::string &key, double value) override;

        /**
         * @brief Start a new segment file
         * @param segment_name Suffix for the new file (empty = auto-numbered segment_N)
         */
        void mark(const std::string &segment_name = "");

        bool is_open() const { return file_ != nullptr; }
        const std::string &get_filename() const { return current_filename_; }

    private:
        SignalLoggerConfig config_;
        const util::IClock *clock_;
        FILE *file_;
        int segment_counter_;
        std::string current_filename_;

        void open_new_file(const std::string &segment_name);
        void close_current_file();
        uint32_t timestamp_ms() const;
        std::string generate_filename(const std::string &segment_name) const;
    };
}
