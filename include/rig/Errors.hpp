#pragma once
#include <stdexcept>
#include <string>

// Raised when a rig is built from a frame that lacks a joint the topology needs.
class MissingJointError : public std::runtime_error {
    std::string m_joint_name;

public:
    explicit MissingJointError(const std::string& joint_name)
        : std::runtime_error("missing transform for joint '" + joint_name + "'")
        , m_joint_name(joint_name)
    {
    }

    const std::string& joint_name() const { return m_joint_name; }
};

class InvalidTopologyError : public std::invalid_argument {
public:
    explicit InvalidTopologyError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};
