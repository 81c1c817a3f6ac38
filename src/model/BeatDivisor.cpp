#include "BeatDivisor.h"
#include <algorithm>
#include <stdexcept>

namespace rs
{

BeatDivisor::BeatDivisor (int initialValue)
    : value (initialValue)
{
    if (initialValue < 1)
        throw std::invalid_argument ("beat divisor must be at least 1");
}

void BeatDivisor::setValue (int newValue)
{
    if (newValue < 1)
        throw std::invalid_argument ("beat divisor must be at least 1");

    value = newValue;
    DBG ("BeatDivisor: 1/" << value);

    listeners.call ([this] (Listener& l) { l.beatDivisorChanged (value); });
}

void BeatDivisor::adjust (int delta)
{
    const int numDivisors = static_cast<int> (predefinedDivisors.size());

    // Start from the nearest predefined divisor not above the current value
    int currentIdx = 0;
    for (int i = 0; i < numDivisors; ++i)
    {
        if (predefinedDivisors[static_cast<size_t> (i)] <= value)
            currentIdx = i;
    }

    int newIdx = std::clamp (currentIdx + delta, 0, numDivisors - 1);
    setValue (predefinedDivisors[static_cast<size_t> (newIdx)]);
}

void BeatDivisor::addListener (Listener* listener)
{
    if (listener == nullptr)
        return;

    listeners.add (listener);
    listener->beatDivisorChanged (value);
}

void BeatDivisor::removeListener (Listener* listener)
{
    listeners.remove (listener);
}

bool BeatDivisor::isPredefined (int divisor)
{
    return std::find (predefinedDivisors.begin(), predefinedDivisors.end(), divisor)
           != predefinedDivisors.end();
}

int BeatDivisor::getDivisorForBeatIndex (int index, int beatDivisor)
{
    if (beatDivisor < 1)
        throw std::invalid_argument ("beat divisor must be at least 1");

    int beat = index % beatDivisor;

    for (int divisor : predefinedDivisors)
    {
        if ((beat * divisor) % beatDivisor == 0)
            return divisor;
    }

    return beatDivisor;
}

} // namespace rs
