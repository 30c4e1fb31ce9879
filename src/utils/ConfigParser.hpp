#pragma once

#include "Status.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Command line parameters of the form --name=value or --name value. Each config struct
// registers its fields through add_params_to_config_parser(); defaults are applied on
// registration so a struct is usable even when nothing is passed on the command line.
class Parameter
{
public:
    Parameter(const std::string &name, const std::string &default_value, bool required, const std::string &description)
        : m_name(name), m_default_value(default_value), m_required(required), m_description(description)
    {
    }
    virtual ~Parameter() = default;

    virtual Status Parse(const std::string &value) = 0;
    virtual std::string TypeName() const = 0;
    virtual bool IsFlag() const { return false; }

    const std::string &name() const { return m_name; }
    const std::string &default_value() const { return m_default_value; }
    const std::string &description() const { return m_description; }
    bool required() const { return m_required; }
    bool is_set() const { return m_set; }
    void mark_set() { m_set = true; }

protected:
    Status _bad_value(const std::string &value) const { return Status::InvalidArgument("'" + value + "' is not a valid " + TypeName() + " for --" + m_name); }

private:
    std::string m_name;
    std::string m_default_value;
    bool m_required;
    std::string m_description;
    bool m_set = false;
};

template <typename UInt> class UnsignedIntParameter : public Parameter
{
public:
    UnsignedIntParameter(const std::string &name, const std::string &default_value, UInt *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target)
    {
    }

    Status Parse(const std::string &value) override
    {
        if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) return _bad_value(value);

        errno = 0;
        unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
        if (errno == ERANGE || parsed > std::numeric_limits<UInt>::max()) return _bad_value(value);
        *m_target = static_cast<UInt>(parsed);
        return Status::OK();
    }

    std::string TypeName() const override { return sizeof(UInt) == 4 ? "uint32" : "uint64"; }

private:
    UInt *m_target;
};

using UnsignedInt32Parameter = UnsignedIntParameter<uint32_t>;
using UnsignedInt64Parameter = UnsignedIntParameter<uint64_t>;

class FloatParameter : public Parameter
{
public:
    FloatParameter(const std::string &name, const std::string &default_value, float *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target)
    {
    }

    Status Parse(const std::string &value) override
    {
        char *end = nullptr;
        errno = 0;
        float parsed = std::strtof(value.c_str(), &end);
        if (value.empty() || *end != '\0' || errno == ERANGE) return _bad_value(value);
        *m_target = parsed;
        return Status::OK();
    }

    std::string TypeName() const override { return "float"; }

private:
    float *m_target;
};

class StringParameter : public Parameter
{
public:
    StringParameter(const std::string &name, const std::string &default_value, std::string *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target)
    {
    }

    Status Parse(const std::string &value) override
    {
        *m_target = value;
        return Status::OK();
    }

    std::string TypeName() const override { return "string"; }

private:
    std::string *m_target;
};

class BooleanParameter : public Parameter
{
public:
    BooleanParameter(const std::string &name, const std::string &default_value, bool *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target)
    {
    }

    Status Parse(const std::string &value) override
    {
        std::string v = value;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true" || v == "1" || v == "yes") { *m_target = true; }
        else if (v == "false" || v == "0" || v == "no") { *m_target = false; }
        else return _bad_value(value);
        return Status::OK();
    }

    std::string TypeName() const override { return "bool"; }
    bool IsFlag() const override { return true; }

private:
    bool *m_target;
};

class ConfigParser
{
public:
    // Takes ownership of the parameter.
    void AddParameter(Parameter *parameter)
    {
        std::unique_ptr<Parameter> owned(parameter);
        if (m_index.count(owned->name())) throw std::invalid_argument("Parameter --" + owned->name() + " is registered twice.");

        Status s = owned->Parse(owned->default_value());
        if (!s.IsOK()) throw std::invalid_argument("Bad default for --" + owned->name() + ": " + s.ToString());

        m_index[owned->name()] = m_parameters.size();
        m_parameters.push_back(std::move(owned));
    }

    Status ParseCommandLine(int argc, char **argv)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) return Status::InvalidArgument("Expected --name=value, got '" + arg + "'");
            arg = arg.substr(2);

            std::string name = arg;
            std::string value;
            bool has_value = false;
            auto eq = arg.find('=');
            if (eq != std::string::npos)
            {
                name = arg.substr(0, eq);
                value = arg.substr(eq + 1);
                has_value = true;
            }

            auto it = m_index.find(name);
            if (it == m_index.end()) return Status::NotFound("Unknown parameter --" + name);
            Parameter &parameter = *m_parameters[it->second];

            if (!has_value)
            {
                bool next_is_value = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
                if (next_is_value) { value = argv[++i]; }
                else if (parameter.IsFlag()) { value = "true"; }
                else return Status::InvalidArgument("Missing value for --" + name);
            }

            Status s = parameter.Parse(value);
            if (!s.IsOK()) return s;
            parameter.mark_set();
        }

        for (const auto &parameter : m_parameters)
        {
            if (parameter->required() && !parameter->is_set()) return Status::InvalidArgument("Missing required parameter --" + parameter->name());
        }
        return Status::OK();
    }

    void PrintUsage(std::ostream &os = std::cout) const
    {
        size_t name_width = 0;
        for (const auto &p : m_parameters) name_width = std::max(name_width, p->name().size() + 2);

        os << "Parameters:" << std::endl;
        for (const auto &p : m_parameters)
        {
            os << "  " << std::left << std::setw(name_width + 2) << ("--" + p->name()) << std::setw(8) << p->TypeName() << p->description();
            if (p->required()) { os << " (required)"; }
            else { os << " [default: " << p->default_value() << "]"; }
            os << std::endl;
        }
    }

    void PrintMarkdown(std::ostream &os = std::cout) const
    {
        os << "| Parameter | Type | Default | Required | Description |" << std::endl;
        os << "|-----------|------|---------|----------|-------------|" << std::endl;
        for (const auto &p : m_parameters)
        {
            os << "| `--" << p->name() << "` | " << p->TypeName() << " | `" << p->default_value() << "` | " << (p->required() ? "yes" : "no") << " | " << p->description() << " |"
               << std::endl;
        }
    }

private:
    std::vector<std::unique_ptr<Parameter>> m_parameters;
    std::map<std::string, size_t> m_index;
};
