#include <algorithm>

#include "nostrcast/util/backoff.hpp"

using namespace nostrcast::util;
using namespace std;

ExponentialBackoff::ExponentialBackoff(chrono::milliseconds initialDelay, chrono::milliseconds maxDelay)
: _initialDelay(initialDelay), _maxDelay(max(initialDelay, maxDelay)), _delay(initialDelay) { };

chrono::milliseconds ExponentialBackoff::delay() const { return this->_delay; };

chrono::milliseconds ExponentialBackoff::increase()
{
    this->_delay = min(this->_delay * 2, this->_maxDelay);
    return this->_delay;
};

void ExponentialBackoff::reset()
{
    this->_delay = this->_initialDelay;
};

chrono::milliseconds ExponentialBackoff::initialDelay() const { return this->_initialDelay; };

chrono::milliseconds ExponentialBackoff::maxDelay() const { return this->_maxDelay; };
