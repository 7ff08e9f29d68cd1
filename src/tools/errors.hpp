#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <stdexcept>

namespace SeqCal
{
    #define S_CHECK(cond, message) \
    if (!(cond)) { throw std::runtime_error(message); }

    #define S_THROW(message) \
    throw std::runtime_error(message);

    struct InvalidFileError : public std::exception
    {
        InvalidFileError(const std::string &file) : file(file) {}
        const std::string file;
    };

    struct FailedCommandException : public std::runtime_error
    {
        FailedCommandException(const std::string &msg) : std::runtime_error(msg) {}
    };

    struct InvalidFormatException : public std::runtime_error
    {
        InvalidFormatException(const std::string &msg) : std::runtime_error(msg) {}
    };

    /*
     * Region arithmetic failed (eg: flank larger than the region). The offending region is
     * always part of the message.
     */

    struct InvalidRegionError : public std::runtime_error
    {
        InvalidRegionError(const std::string &region, const std::string &msg)
            : std::runtime_error(msg + ": " + region), region(region) {}
        const std::string region;
    };

    // Calibration can't continue without producing a nonsensical output
    struct CalibrationError : public std::runtime_error
    {
        CalibrationError(const std::string &msg) : std::runtime_error(msg) {}
    };
}

#endif
