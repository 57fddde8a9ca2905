#define BOOST_TEST_MODULE Hypervisor Tests
#include <boost/test/included/unit_test.hpp>
