#ifndef GLV_EM_HPP
#define GLV_EM_HPP

// Include all library headers here
#include "abundance_data.hpp"
#include "e_step.hpp"
#include "elastic_net_oracle.hpp"
#include "em_config.hpp"
#include "em_driver.hpp"
#include "least_squares_oracle.hpp"
#include "m_step.hpp"
#include "normalization.hpp"
#include "preprocessing.hpp"
#include "regression_oracle.hpp"
#include "result_io.hpp"
#include "sample_filter.hpp"

// This is the main header file for the glv_em library
// Include this single header to access all functionality

#endif // GLV_EM_HPP
