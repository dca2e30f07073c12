#pragma once

#include <string>
#include <vector>

namespace swerveid::telemetry
{
    /**
     * @brief Keyed signal sink for characterization data
     *
     * Fire-and-forget. Implementations must not throw back into the
     * control loop when storage fails.
     */
    class ISignalLog
    {
    public:
        virtual ~ISignalLog() = default;
        virtual void write_string(const std::string &key, const std::string &value) = 0;
        virtual void write_double(const std::string &key, double value) = 0;
    };

    enum class SignalType
    {
        STRING,
        DOUBLE
    };

    inline const char *signal_type_to_string(SignalType type)
    {
        switch (type)
        {
        case SignalType::STRING:
            return "string";
        case SignalType::DOUBLE:
            return "double";
        default:
            return "unknown";
        }
    }

    struct SignalEntry
    {
        std::string key;
        SignalType type;
        std::string string_value;
        double double_value;
    };

    /**
     * @brief ISignalLog that keeps every entry in RAM
     */
    class MemorySignalLog : public ISignalLog
    {
    private:
        std::vector<SignalEntry> entries_;

    public:
        void write_string(const std::string &key, const std::string &value) override
        {
            entries_.push_back(SignalEntry{key, SignalType::STRING, value, 0.0});
        }

        void write_double(const std::string &key, double value) override
        {
            entries_.push_back(SignalEntry{key, SignalType::DOUBLE, "", value});
        }

        const std::vector<SignalEntry> &entries() const { return entries_; }

        // Most recent entry for key, or nullptr
        const SignalEntry *latest(const std::string &key) const
        {
            for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
            {
                if (it->key == key)
                {
                    return &*it;
                }
            }
            return nullptr;
        }

        void clear() { entries_.clear(); }
    };
}
