#pragma once
#include <juce_core/juce_core.h>
#include <array>

namespace rs
{

// Beat subdivision shared by the editor. Every write notifies listeners,
// including writes that leave the value unchanged.
class BeatDivisor
{
public:
    static constexpr std::array<int, 8> predefinedDivisors { 1, 2, 3, 4, 6, 8, 12, 16 };

    class Listener
    {
    public:
        virtual ~Listener() = default;
        virtual void beatDivisorChanged (int newDivisor) = 0;
    };

    explicit BeatDivisor (int initialValue = 4);

    int getValue() const { return value; }
    void setValue (int newValue);

    // Steps through predefinedDivisors, clamping at either end
    void adjust (int delta);

    // The listener is called once immediately with the current value
    void addListener (Listener* listener);
    void removeListener (Listener* listener);
    int getNumListeners() const { return listeners.size(); }

    // Smallest predefined divisor with a tick exactly on the given 1-based beat index.
    // Falls back to beatDivisor itself when no predefined divisor lands on it.
    static int getDivisorForBeatIndex (int index, int beatDivisor);

    static bool isPredefined (int divisor);

private:
    int value;
    juce::ListenerList<Listener> listeners;
};

} // namespace rs
