/**
 * @file iqueryconnection.cpp
 * @brief Implementation file for the IQueryConnection interface.
 *
 * Exists so MOC generates the signal infrastructure of the interface.
 */

#include "iqueryconnection.h"
