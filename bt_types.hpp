#ifndef BT_TYPES_HPP
#define BT_TYPES_HPP

/*types*/
#define st32 int
#define ut8 unsigned char

/* sentinel for an unset position or capture index */
#define BT_NPOS (-1)

/* type annotations */
#define BT_BORROW  /* pointer ownership is not transferred, it must not be     \
                      freed by the receiver */
#define BT_NONNULL /* pointer can not be null */

#endif // BT_TYPES_HPP
