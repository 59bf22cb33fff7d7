// SINGLE SOURCE OF TRUTH for key and role names. Should be clear and clean.
// Format: X(EnumName, StringName)

// Row-major over the 3x3 grid.
#define SWIPEFICIENCY_KEYS(X) \
    X(Key_TopLeft, "TopLeft") \
    X(Key_Top, "Top") \
    X(Key_TopRight, "TopRight") \
    X(Key_Left, "Left") \
    X(Key_Center, "Center") \
    X(Key_Right, "Right") \
    X(Key_BottomLeft, "BottomLeft") \
    X(Key_Bottom, "Bottom") \
    X(Key_BottomRight, "BottomRight")

#define SWIPEFICIENCY_ROLES(X) \
    X(Tap, "Tap") \
    X(SwipeUp, "Up") \
    X(SwipeDown, "Down") \
    X(SwipeLeft, "Left") \
    X(SwipeRight, "Right")

#define SWIPEFICIENCY_KEY_RELATIONS(X) \
    X(SameKey, "SameKey") \
    X(SideNeighbor, "SideNeighbor") \
    X(CornerNeighbor, "CornerNeighbor") \
    X(Unrelated, "Unrelated")
