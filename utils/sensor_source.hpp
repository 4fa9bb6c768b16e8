/*
 * Sensor_Source - Per-tick controller sample provider
 */

#ifndef SENSOR_SOURCE_HPP
#define SENSOR_SOURCE_HPP

#include "types.h"

class Sensor_Source {
public:
    virtual ~Sensor_Source() = default;

    /* Returns false if no valid sample could be read this tick */
    virtual bool read(RawSample &out) = 0;
};

#endif // SENSOR_SOURCE_HPP
