#pragma once

#include <string>

class Status
{
public:
    enum class Code
    {
        kOK,
        kInvalidArgument,
        kNotFound,
        kIOError
    };

    Status() = default;

    static Status OK() { return Status(); }
    static Status InvalidArgument(const std::string &msg) { return Status(Code::kInvalidArgument, msg); }
    static Status NotFound(const std::string &msg) { return Status(Code::kNotFound, msg); }
    static Status IOError(const std::string &msg) { return Status(Code::kIOError, msg); }

    bool IsOK() const { return m_code == Code::kOK; }
    Code code() const { return m_code; }

    std::string ToString() const
    {
        switch (m_code)
        {
        case Code::kOK: return "OK";
        case Code::kInvalidArgument: return "Invalid argument: " + m_msg;
        case Code::kNotFound: return "Not found: " + m_msg;
        case Code::kIOError: return "IO error: " + m_msg;
        }
        return m_msg;
    }

private:
    Status(Code code, const std::string &msg) : m_code(code), m_msg(msg) {}

    Code m_code = Code::kOK;
    std::string m_msg;
};
