#ifndef CLUSTER_EXCEPTIONS_H
#define CLUSTER_EXCEPTIONS_H

#include <string>
#include <pcl/exceptions.h>

// Bad input: mixed dimensionality, non-finite coordinates, negative radius.
class ClusterConfigException : public pcl::PCLException
{
public:
    ClusterConfigException(const std::string& error_description,
                           const char* file_name = nullptr,
                           const char* function_name = nullptr,
                           unsigned line_number = 0)
    : pcl::PCLException(error_description, file_name, function_name, line_number)
    {}
};

// Operation called out of order, e.g. compressing before matching.
class ClusterStateException : public pcl::PCLException
{
public:
    ClusterStateException(const std::string& error_description,
                          const char* file_name = nullptr,
                          const char* function_name = nullptr,
                          unsigned line_number = 0)
    : pcl::PCLException(error_description, file_name, function_name, line_number)
    {}
};

#endif // CLUSTER_EXCEPTIONS_H
